#pragma once

#include <chrono>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace sagabus {

/**
 * Helper functions for working with sagabus types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/examples.OrderPlaced")
 * @param type_name Fully qualified type name (e.g., "examples.OrderPlaced")
 * @return true if type_url equals TYPE_URL_PREFIX + type_name
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Fully qualified protobuf name of a message type.
 */
template<typename T>
std::string type_name() {
    return T::descriptor()->full_name();
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Timestamp `delay` after now.
 */
google::protobuf::Timestamp from_now(std::chrono::milliseconds delay);

/**
 * Returns true if `lhs` is strictly earlier than `rhs`.
 */
inline bool is_before(const google::protobuf::Timestamp& lhs,
                      const google::protobuf::Timestamp& rhs) {
    if (lhs.seconds() != rhs.seconds()) return lhs.seconds() < rhs.seconds();
    return lhs.nanos() < rhs.nanos();
}

/**
 * Format a timestamp as ISO-8601 UTC with second precision.
 */
std::string to_iso8601(const google::protobuf::Timestamp& ts);

/**
 * Strip an http:// or https:// scheme so the endpoint can be handed to gRPC.
 */
inline std::string format_endpoint(const std::string& endpoint) {
    auto pos = endpoint.find("://");
    if (pos == std::string::npos) {
        return endpoint;
    }
    return endpoint.substr(pos + 3);
}

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

} // namespace helpers
} // namespace sagabus
