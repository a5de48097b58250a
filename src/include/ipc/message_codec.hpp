#pragma once
/**
 * @file message_codec.hpp
 * @brief Envelope-level encoding and decoding of wire frames.
 *
 * A frame is the UTF-8 text of `{"messageType": <tag>, "data": {...}}`.
 * Decoding never throws: malformed text, unknown tags and missing fields are
 * routine on a long-lived channel and are reported as a `DecodeError`.
 */
#include "gwbridge_core_export.h"
#include "ipc/messages.hpp"
#include "utils/result.hpp"

#include <string>
#include <string_view>

namespace gwbridge::ipc
{

enum class DecodeError
{
    Malformed,     ///< Not JSON, or not an object with a string `messageType`.
    UnknownType,   ///< Well-formed envelope whose tag this family does not know.
    InvalidFields, ///< Known tag, but `data` is missing or does not match the message.
};

[[nodiscard]] GWBRIDGE_CORE_EXPORT const char *to_string(DecodeError err) noexcept;

[[nodiscard]] GWBRIDGE_CORE_EXPORT std::string encode(const HandshakeMessage &msg);
[[nodiscard]] GWBRIDGE_CORE_EXPORT std::string encode(const GatewayMessage &msg);
[[nodiscard]] GWBRIDGE_CORE_EXPORT std::string encode(const PluginMessage &msg);

[[nodiscard]] GWBRIDGE_CORE_EXPORT utils::Result<HandshakeMessage, DecodeError>
decode_handshake_message(std::string_view frame);

[[nodiscard]] GWBRIDGE_CORE_EXPORT utils::Result<GatewayMessage, DecodeError>
decode_gateway_message(std::string_view frame);

[[nodiscard]] GWBRIDGE_CORE_EXPORT utils::Result<PluginMessage, DecodeError>
decode_plugin_message(std::string_view frame);

} // namespace gwbridge::ipc
