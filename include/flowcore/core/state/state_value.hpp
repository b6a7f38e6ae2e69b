#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace FlowCore {

/// Serialized object payload stored as opaque bytes
using StateBlob = std::vector<uint8_t>;

/**
 * Value held by a state store. Construct explicitly:
 * StateValue{std::string("x")}, StateValue{int64_t{5}}, StateValue{2.5}.
 */
using StateValue = std::variant<std::monostate, bool, int64_t, double, std::string, StateBlob>;

/// Estimated footprint: strings 2 bytes/char, numbers 8, booleans 4, blobs by length, null 0
size_t estimateValueSize(const StateValue& value);

/// Namespace name and keys at 2 bytes/char plus every value
size_t estimateNamespaceSize(const std::string& ns, const std::map<std::string, StateValue>& entries);

} // namespace FlowCore
