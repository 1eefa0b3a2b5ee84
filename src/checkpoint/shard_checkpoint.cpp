#include "shardmark/checkpoint/shard_checkpoint.hpp"

#include <algorithm>
#include <utility>

namespace shardmark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.shard";

auto precondition(std::string message) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::precondition_failed, std::move(message), kComponent});
}

auto strip_leading_zeros(std::string_view s) noexcept -> std::string_view {
  auto pos = s.find_first_not_of('0');
  if (pos == std::string_view::npos) return s.empty() ? s : s.substr(s.size() - 1);
  return s.substr(pos);
}

bool is_sequence_type(ShardIteratorType t) noexcept {
  return t == ShardIteratorType::AtSequenceNumber || t == ShardIteratorType::AfterSequenceNumber;
}

} // namespace

auto to_string(ShardIteratorType type) noexcept -> std::string_view {
  switch (type) {
    case ShardIteratorType::AtSequenceNumber: return "AT_SEQUENCE_NUMBER";
    case ShardIteratorType::AfterSequenceNumber: return "AFTER_SEQUENCE_NUMBER";
    case ShardIteratorType::TrimHorizon: return "TRIM_HORIZON";
    case ShardIteratorType::Latest: return "LATEST";
    case ShardIteratorType::AtTimestamp: return "AT_TIMESTAMP";
  }
  return "UNKNOWN";
}

auto parse_iterator_type(std::string_view name) noexcept -> std::optional<ShardIteratorType> {
  for (auto t : {ShardIteratorType::AtSequenceNumber, ShardIteratorType::AfterSequenceNumber,
                 ShardIteratorType::TrimHorizon, ShardIteratorType::Latest,
                 ShardIteratorType::AtTimestamp}) {
    if (to_string(t) == name) return t;
  }
  return std::nullopt;
}

auto is_valid_sequence_number(std::string_view s) noexcept -> bool {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

auto compare_sequence_numbers(std::string_view a, std::string_view b) noexcept -> int {
  a = strip_leading_zeros(a);
  b = strip_leading_zeros(b);
  if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
  int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

auto ShardCheckpoint::create(std::string stream_name, std::string shard_id,
                             ShardIteratorType type, std::string sequence_number,
                             std::optional<std::uint64_t> sub_sequence_number,
                             std::optional<std::int64_t> timestamp_ms)
    -> std::expected<ShardCheckpoint, core::error> {
  if (stream_name.empty()) return precondition("empty stream name");
  if (shard_id.empty()) return precondition("empty shard id");

  if (is_sequence_type(type)) {
    if (!is_valid_sequence_number(sequence_number)) {
      return precondition("invalid sequence number \"" + sequence_number + "\" for shard " + shard_id);
    }
    if (timestamp_ms) return precondition("timestamp given for sequence position of shard " + shard_id);
  } else {
    if (!sequence_number.empty() || sub_sequence_number) {
      return precondition(std::string("sequence data given for ") + std::string(checkpoint::to_string(type)) +
                          " position of shard " + shard_id);
    }
    if (type == ShardIteratorType::AtTimestamp && !timestamp_ms) {
      return precondition("missing timestamp for AT_TIMESTAMP position of shard " + shard_id);
    }
    if (type != ShardIteratorType::AtTimestamp && timestamp_ms) {
      return precondition(std::string("timestamp given for ") + std::string(checkpoint::to_string(type)) +
                          " position of shard " + shard_id);
    }
  }

  ShardCheckpoint ck;
  ck.stream_name_ = std::move(stream_name);
  ck.shard_id_ = std::move(shard_id);
  ck.type_ = type;
  ck.sequence_number_ = std::move(sequence_number);
  ck.sub_sequence_number_ = sub_sequence_number;
  ck.timestamp_ms_ = timestamp_ms;
  return ck;
}

auto ShardCheckpoint::trim_horizon(std::string stream_name, std::string shard_id)
    -> std::expected<ShardCheckpoint, core::error> {
  return create(std::move(stream_name), std::move(shard_id), ShardIteratorType::TrimHorizon);
}

auto ShardCheckpoint::latest(std::string stream_name, std::string shard_id)
    -> std::expected<ShardCheckpoint, core::error> {
  return create(std::move(stream_name), std::move(shard_id), ShardIteratorType::Latest);
}

auto ShardCheckpoint::at_timestamp(std::string stream_name, std::string shard_id, std::int64_t timestamp_ms)
    -> std::expected<ShardCheckpoint, core::error> {
  return create(std::move(stream_name), std::move(shard_id), ShardIteratorType::AtTimestamp, {},
                std::nullopt, timestamp_ms);
}

auto ShardCheckpoint::at_sequence(std::string stream_name, std::string shard_id,
                                  std::string sequence_number,
                                  std::optional<std::uint64_t> sub_sequence_number)
    -> std::expected<ShardCheckpoint, core::error> {
  return create(std::move(stream_name), std::move(shard_id), ShardIteratorType::AtSequenceNumber,
                std::move(sequence_number), sub_sequence_number);
}

auto ShardCheckpoint::after_sequence(std::string stream_name, std::string shard_id,
                                     std::string sequence_number,
                                     std::optional<std::uint64_t> sub_sequence_number)
    -> std::expected<ShardCheckpoint, core::error> {
  return create(std::move(stream_name), std::move(shard_id), ShardIteratorType::AfterSequenceNumber,
                std::move(sequence_number), sub_sequence_number);
}

auto ShardCheckpoint::move_after(const RecordPosition& record) const
    -> std::expected<ShardCheckpoint, core::error> {
  return after_sequence(stream_name_, shard_id_, record.sequence_number, record.sub_sequence_number);
}

auto ShardCheckpoint::is_before_or_at(const RecordPosition& record) const noexcept -> bool {
  switch (type_) {
    case ShardIteratorType::TrimHorizon:
    case ShardIteratorType::Latest:
      return true;
    case ShardIteratorType::AtTimestamp:
      return *timestamp_ms_ <= record.approximate_arrival_ms;
    case ShardIteratorType::AtSequenceNumber:
    case ShardIteratorType::AfterSequenceNumber:
      break;
  }
  int result = compare_sequence_numbers(sequence_number_, record.sequence_number);
  if (result == 0) {
    const std::uint64_t own = sub_sequence_number_.value_or(0);
    if (own != record.sub_sequence_number) result = own < record.sub_sequence_number ? -1 : 1;
  }
  if (result == 0) return type_ == ShardIteratorType::AtSequenceNumber;
  return result < 0;
}

auto ShardCheckpoint::to_string() const -> std::string {
  std::string out = "ShardCheckpoint{stream=" + stream_name_ + ", shard=" + shard_id_ +
                    ", type=" + std::string(checkpoint::to_string(type_));
  if (!sequence_number_.empty()) out += ", seq=" + sequence_number_;
  if (sub_sequence_number_) out += ", subseq=" + std::to_string(*sub_sequence_number_);
  if (timestamp_ms_) out += ", ts=" + std::to_string(*timestamp_ms_);
  out += "}";
  return out;
}

} // namespace shardmark::checkpoint
