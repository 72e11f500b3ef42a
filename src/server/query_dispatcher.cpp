#include "server/query_dispatcher.hpp"
#include "protocol/name_codec.hpp"
#include "protocol/metadata_codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <vector>

namespace dnsfs {
namespace server {

namespace {

const std::string META_PREFIX = "meta";
const std::string CHUNK_PREFIX = "chunk";

std::vector<std::string> split_labels(const std::string& label) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t dot = label.find('.', start);
    parts.push_back(label.substr(start, dot - start));
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return parts;
}

// Strict non-negative decimal: no sign, no whitespace, no overflow
std::optional<size_t> parse_index(const std::string& digits) {
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::nullopt;
  }
  size_t index = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return index;
}

} // namespace

const char* to_string(DispatchOutcome outcome) {
  switch (outcome) {
    case DispatchOutcome::WELCOME: return "welcome";
    case DispatchOutcome::METADATA: return "metadata";
    case DispatchOutcome::CHUNK: return "chunk";
    case DispatchOutcome::ZONE_MISMATCH: return "zone mismatch";
    case DispatchOutcome::WRONG_RECORD_TYPE: return "wrong record type";
    case DispatchOutcome::UNKNOWN_ROUTE: return "unknown route";
    case DispatchOutcome::MALFORMED_INDEX: return "malformed index";
    case DispatchOutcome::FILE_NOT_FOUND: return "file not found";
    case DispatchOutcome::INDEX_OUT_OF_RANGE: return "index out of range";
    case DispatchOutcome::STORAGE_FAILURE: return "storage failure";
    default: return "unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

QueryDispatcher::QueryDispatcher(const store::FileSource& files, const std::string& zone,
                                 size_t chunk_width)
  : files_(files)
  , zone_(protocol::normalize_zone(zone))
  , codec_(chunk_width) {
  if (chunk_width > protocol::MAX_CHUNK_WIDTH) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Chunk width " << chunk_width << " exceeds "
                             << protocol::MAX_CHUNK_WIDTH;
    throw std::invalid_argument("Dispatcher: chunk width must not exceed " +
                                std::to_string(protocol::MAX_CHUNK_WIDTH));
  }
  if (zone_ == ".") {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Empty zone";
    throw std::invalid_argument("Dispatcher: zone must not be empty");
  }

  std::string bare_zone = zone_.substr(0, zone_.size() - 1);
  welcome_ = "dnsfs: use meta.<name>." + bare_zone;

  BOOST_LOG_TRIVIAL(info) << "Dispatcher: Serving zone " << zone_ << " with chunk width " << chunk_width;
}


//==============================================
// DISPATCH
//==============================================

DispatchResult QueryDispatcher::dispatch(const protocol::Query& query) const {
  // Zone check, case-insensitive, trailing dot optional on the query
  std::string name(query.qualified_name);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (name.empty() || name.back() != '.') {
    name.push_back('.');
  }

  if (name.size() < zone_.size() ||
      name.compare(name.size() - zone_.size(), zone_.size(), zone_) != 0) {
    return negative(DispatchOutcome::ZONE_MISMATCH);
  }

  // Type check
  if (query.record_type != static_cast<uint16_t>(protocol::RecordType::TXT)) {
    return negative(DispatchOutcome::WRONG_RECORD_TYPE);
  }

  // Label parse: drop zone, then separators on both ends
  std::string label = name.substr(0, name.size() - zone_.size());
  auto first = label.find_first_not_of('.');
  if (first == std::string::npos) {
    return {DispatchOutcome::WELCOME, protocol::Reply::ok(welcome_)};
  }
  label = label.substr(first, label.find_last_not_of('.') - first + 1);

  // Route
  auto parts = split_labels(label);
  if (parts.size() == 2) {
    if (parts[0] == META_PREFIX) {
      return handle_meta(parts[1]);
    }
    if (parts[0].compare(0, CHUNK_PREFIX.size(), CHUNK_PREFIX) == 0) {
      return handle_chunk(parts[0].substr(CHUNK_PREFIX.size()), parts[1]);
    }
  }

  return negative(DispatchOutcome::UNKNOWN_ROUTE);
}


//==============================================
// HANDLERS
//==============================================

DispatchResult QueryDispatcher::handle_meta(const std::string& raw_name) const {
  const std::string name = protocol::sanitize_name(raw_name);

  std::optional<protocol::Bytes> data;
  try {
    data = resolve_file(name);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Storage failure for " << name << ": " << e.what();
    return negative(DispatchOutcome::STORAGE_FAILURE);
  }
  if (!data) {
    return negative(DispatchOutcome::FILE_NOT_FOUND);
  }

  auto metadata = protocol::MetadataCodec::describe(*data, codec_);
  return {DispatchOutcome::METADATA, protocol::Reply::ok(protocol::MetadataCodec::format(metadata))};
}

DispatchResult QueryDispatcher::handle_chunk(const std::string& index_part,
                                             const std::string& raw_name) const {
  auto index = parse_index(index_part);
  if (!index) {
    return negative(DispatchOutcome::MALFORMED_INDEX);
  }

  const std::string name = protocol::sanitize_name(raw_name);

  std::optional<protocol::Bytes> data;
  try {
    data = resolve_file(name);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Dispatcher: Storage failure for " << name << ": " << e.what();
    return negative(DispatchOutcome::STORAGE_FAILURE);
  }
  if (!data) {
    return negative(DispatchOutcome::FILE_NOT_FOUND);
  }

  auto chunk = codec_.chunk_at(*data, *index);
  if (!chunk) {
    return negative(DispatchOutcome::INDEX_OUT_OF_RANGE);
  }
  return {DispatchOutcome::CHUNK, protocol::Reply::ok(std::move(*chunk))};
}


//==============================================
// UTILITY METHODS
//==============================================

std::optional<protocol::Bytes> QueryDispatcher::resolve_file(const std::string& name) const {
  if (name.empty()) {
    return std::nullopt;
  }

  for (const auto& candidate : {name, name + ".bin", name + ".txt"}) {
    auto data = files_.read(candidate);
    if (data) {
      BOOST_LOG_TRIVIAL(debug) << "Dispatcher: Resolved " << name << " to " << candidate;
      return data;
    }
  }
  return std::nullopt;
}

DispatchResult QueryDispatcher::negative(DispatchOutcome outcome) {
  return {outcome, protocol::Reply::not_found()};
}

} // namespace server
} // namespace dnsfs
