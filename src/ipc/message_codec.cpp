#include "ipc/message_codec.hpp"

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace gwbridge::ipc
{

namespace
{
constexpr const char *kTypeKey = "messageType";
constexpr const char *kDataKey = "data";

template <typename Variant> std::string encode_envelope(const Variant &msg)
{
    return std::visit(
        [](const auto &m) {
            json envelope;
            envelope[kTypeKey] = std::string(std::decay_t<decltype(m)>::kMessageType);
            envelope[kDataKey] = m;
            return envelope.dump();
        },
        msg);
}

/**
 * Parses the envelope and tries every alternative of @p Variant whose tag
 * matches `messageType`. Tags are unique within a family, so at most one
 * alternative is attempted.
 */
template <typename Variant>
utils::Result<Variant, DecodeError> decode_envelope(std::string_view frame)
{
    using ResultT = utils::Result<Variant, DecodeError>;

    const json envelope = json::parse(frame.begin(), frame.end(), nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object())
    {
        return ResultT::error(DecodeError::Malformed);
    }
    const auto type_it = envelope.find(kTypeKey);
    if (type_it == envelope.end() || !type_it->is_string())
    {
        return ResultT::error(DecodeError::Malformed);
    }
    const auto &tag = type_it->template get_ref<const std::string &>();
    const auto data_it = envelope.find(kDataKey);

    std::optional<Variant> decoded;
    bool tag_known = false;

    auto try_alternative = [&]<typename Alt>(std::type_identity<Alt>) {
        if (tag_known || tag != Alt::kMessageType)
            return;
        tag_known = true;
        if (data_it == envelope.end() || !data_it->is_object())
            return;
        try
        {
            decoded.emplace(std::in_place_type<Alt>, data_it->template get<Alt>());
        }
        catch (const std::exception &)
        {
            // json::exception or std::invalid_argument from from_json;
            // `decoded` stays empty and is reported as InvalidFields.
            return;
        }
    };

    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (try_alternative(std::type_identity<std::variant_alternative_t<I, Variant>>{}), ...);
    }(std::make_index_sequence<std::variant_size_v<Variant>>{});

    if (!tag_known)
    {
        return ResultT::error(DecodeError::UnknownType);
    }
    if (!decoded)
    {
        return ResultT::error(DecodeError::InvalidFields);
    }
    return ResultT::ok(std::move(*decoded));
}

} // namespace

const char *to_string(DecodeError err) noexcept
{
    switch (err)
    {
    case DecodeError::Malformed: return "malformed frame";
    case DecodeError::UnknownType: return "unknown messageType";
    case DecodeError::InvalidFields: return "invalid message fields";
    }
    return "unknown decode error";
}

std::string encode(const HandshakeMessage &msg)
{
    return encode_envelope(msg);
}

std::string encode(const GatewayMessage &msg)
{
    return encode_envelope(msg);
}

std::string encode(const PluginMessage &msg)
{
    return encode_envelope(msg);
}

utils::Result<HandshakeMessage, DecodeError> decode_handshake_message(std::string_view frame)
{
    return decode_envelope<HandshakeMessage>(frame);
}

utils::Result<GatewayMessage, DecodeError> decode_gateway_message(std::string_view frame)
{
    return decode_envelope<GatewayMessage>(frame);
}

utils::Result<PluginMessage, DecodeError> decode_plugin_message(std::string_view frame)
{
    return decode_envelope<PluginMessage>(frame);
}

} // namespace gwbridge::ipc
