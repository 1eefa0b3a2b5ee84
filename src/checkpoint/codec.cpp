#include "shardmark/checkpoint/codec.hpp"

#include <charconv>
#include <optional>
#include <sstream>
#include <vector>

namespace shardmark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.codec";

bool is_encodable_name(std::string_view v) {
  if (v.empty()) return false;
  for (unsigned char c : v) {
    if (c <= 0x20 || c == 0x7F || c == '=') return false;
  }
  return true;
}

template <typename T>
bool parse_integer(std::string_view s, T& out) {
  const char* beg = s.data(); const char* end = beg + s.size();
  if (beg == end) return false;
  auto [ptr, ec] = std::from_chars(beg, end, out, 10);
  return ec == std::errc() && ptr == end;
}

auto parse_error(std::size_t line_no, const std::string& what) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::data_integrity,
                                     "checkpoint parse error at line " + std::to_string(line_no) + ": " + what,
                                     kComponent});
}

} // namespace

auto encode(const ReaderCheckpoint& ck) -> std::expected<std::string, core::error> {
  std::string out(kCodecHeader);
  out += '\n';
  for (const auto& s : ck) {
    if (!is_encodable_name(s.stream_name()) || !is_encodable_name(s.shard_id())) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "unencodable stream or shard name in " + s.to_string(), kComponent});
    }
    out += "stream=" + s.stream_name();
    out += " shard=" + s.shard_id();
    out += " type=" + std::string(to_string(s.iterator_type()));
    if (!s.sequence_number().empty()) out += " seq=" + s.sequence_number();
    if (auto sub = s.sub_sequence_number()) out += " subseq=" + std::to_string(*sub);
    if (auto ts = s.timestamp_ms()) out += " ts=" + std::to_string(*ts);
    out += '\n';
  }
  return out;
}

auto decode(std::string_view text) -> std::expected<ReaderCheckpoint, core::error> {
  std::istringstream in{std::string(text)};
  std::string header;
  if (!std::getline(in, header) || header != kCodecHeader) {
    return std::unexpected(core::error{core::error_code::data_integrity, "bad checkpoint header", kComponent});
  }

  std::vector<ShardCheckpoint> shards;
  std::string line; std::size_t line_no = 1; // header already consumed
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    std::optional<std::string> stream, shard, seq;
    std::optional<ShardIteratorType> type;
    std::optional<std::uint64_t> subseq;
    std::optional<std::int64_t> ts;

    std::istringstream iss(line);
    std::string kv;
    while (iss >> kv) {
      auto eq = kv.find('=');
      if (eq == std::string::npos) return parse_error(line_no, "expected key=value, got \"" + kv + "\"");
      auto k = kv.substr(0, eq);
      auto v = kv.substr(eq + 1);
      if (k == "stream") {
        if (stream) return parse_error(line_no, "duplicate key stream");
        if (!is_encodable_name(v)) return parse_error(line_no, "invalid stream=\"" + v + "\"");
        stream = v;
      } else if (k == "shard") {
        if (shard) return parse_error(line_no, "duplicate key shard");
        if (!is_encodable_name(v)) return parse_error(line_no, "invalid shard=\"" + v + "\"");
        shard = v;
      } else if (k == "type") {
        if (type) return parse_error(line_no, "duplicate key type");
        type = parse_iterator_type(v);
        if (!type) return parse_error(line_no, "invalid type=\"" + v + "\"");
      } else if (k == "seq") {
        if (seq) return parse_error(line_no, "duplicate key seq");
        if (!is_valid_sequence_number(v)) return parse_error(line_no, "invalid seq=\"" + v + "\"");
        seq = v;
      } else if (k == "subseq") {
        if (subseq) return parse_error(line_no, "duplicate key subseq");
        std::uint64_t tmp = 0;
        if (!parse_integer(v, tmp)) return parse_error(line_no, "invalid subseq=\"" + v + "\"");
        subseq = tmp;
      } else if (k == "ts") {
        if (ts) return parse_error(line_no, "duplicate key ts");
        std::int64_t tmp = 0;
        if (!parse_integer(v, tmp)) return parse_error(line_no, "invalid ts=\"" + v + "\"");
        ts = tmp;
      } else {
        return parse_error(line_no, "unknown key \"" + k + "\"");
      }
    }

    if (!stream || !shard || !type) return parse_error(line_no, "missing required field(s)");
    auto sc = ShardCheckpoint::create(std::move(*stream), std::move(*shard), *type,
                                      seq.value_or(std::string{}), subseq, ts);
    if (!sc) return parse_error(line_no, sc.error().message);
    shards.push_back(std::move(*sc));
  }

  ReaderCheckpoint ck(std::move(shards));
  if (auto v = ck.validate_unique_shards(); !v) {
    return std::unexpected(core::error{core::error_code::data_integrity, v.error().message, kComponent});
  }
  return ck;
}

} // namespace shardmark::checkpoint
