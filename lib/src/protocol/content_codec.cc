#include <cpp-zmq-plugin/protocol/content_codec.hpp>
#include <cpp-zmq-plugin/protocol/serialization.hpp>
#include <cpp-zmq-plugin/protocol/validation.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>
#include <cpp-zmq-plugin/util/thread.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".content_codec"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>

#include <memory>

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

//
// Built-in formats
//

static lth_jc::JsonContainer passThrough(const lth_jc::JsonContainer& value) {
    return value;
}

static lth_jc::JsonContainer encodeNative(const lth_jc::JsonContainer& value) {
    return makeStringValue(serializeNative(value));
}

static lth_jc::JsonContainer decodeNative(const lth_jc::JsonContainer& data) {
    return deserializeNative(getStringValue(data));
}

static lth_jc::JsonContainer encodeYaml(const lth_jc::JsonContainer& value) {
    return makeStringValue(serializeYaml(value));
}

static lth_jc::JsonContainer decodeYaml(const lth_jc::JsonContainer& data) {
    return deserializeYaml(getStringValue(data));
}

static lth_jc::JsonContainer encodeJson(const lth_jc::JsonContainer& value) {
    return makeStringValue(serializeJson(value));
}

static lth_jc::JsonContainer decodeJson(const lth_jc::JsonContainer& data) {
    return deserializeJson(getStringValue(data));
}

//
// ContentCodec
//

ContentCodec::ContentCodec()
        : formats_ {} {
    registerFormat(Protocol::NATIVE_MIME_TYPE, encodeNative, decodeNative);
    registerFormat(Protocol::YAML_MIME_TYPE, encodeYaml, decodeYaml);
    registerFormat(Protocol::JSON_MIME_TYPE, encodeJson, decodeJson);
    registerFormat(Protocol::OCTET_STREAM_MIME_TYPE, passThrough, passThrough);
    registerFormat(Protocol::TEXT_MIME_TYPE, passThrough, passThrough);
}

void ContentCodec::registerFormat(const std::string& mime_type,
                                  Encoder encoder,
                                  Decoder decoder) {
    if (mime_type == Protocol::NO_MIME_TYPE || supportsFormat(mime_type)) {
        throw format_redefinition_error {
            lth_loc::format("format '{1}' already defined", mime_type) };
    }

    formats_.insert(std::make_pair(mime_type,
                                   Format { std::move(encoder),
                                            std::move(decoder) }));
}

bool ContentCodec::supportsFormat(const std::string& mime_type) const {
    return formats_.find(mime_type) != formats_.end();
}

std::vector<std::string> ContentCodec::getFormats() const {
    std::vector<std::string> mime_types {};

    for (const auto& format : formats_) {
        mime_types.push_back(format.first);
    }

    return mime_types;
}

lth_jc::JsonContainer ContentCodec::encode(
        const boost::optional<lth_jc::JsonContainer>& data,
        const std::string& mime_type) const {
    lth_jc::JsonContainer content {};

    if (!data) {
        return content;
    }

    if (mime_type == Protocol::NO_MIME_TYPE) {
        content.set<lth_jc::JsonContainer>("data", *data);
        return content;
    }

    content.set<lth_jc::JsonContainer>("data", getFormat(mime_type).encoder(*data));

    lth_jc::JsonContainer metadata {};
    metadata.set<std::string>("mime_type", mime_type);
    content.set<lth_jc::JsonContainer>("metadata", metadata);

    return content;
}

boost::optional<lth_jc::JsonContainer> ContentCodec::decode(
        const lth_jc::JsonContainer& content) const {
    if (content.includes("error")
            && content.type("error") != lth_jc::DataType::Null) {
        auto error = content.get<lth_jc::JsonContainer>("error");
        auto error_txt = content.type("error") == lth_jc::DataType::String
                       ? content.get<std::string>("error")
                       : error.toString();
        LOG_DEBUG("The content reports a remote error: {1}", error_txt);
        throw remote_error {
            lth_loc::format("remote error: {1}", error_txt), error };
    }

    auto mime_type = Protocol::DEFAULT_MIME_TYPE;

    if (content.includes({ "metadata", "mime_type" })) {
        if (content.type({ "metadata", "mime_type" }) != lth_jc::DataType::String) {
            throw unsupported_format_error {
                lth_loc::format("unsupported format {1}",
                                content.get<lth_jc::JsonContainer>(
                                    { "metadata", "mime_type" }).toString()) };
        }

        mime_type = content.get<std::string>({ "metadata", "mime_type" });
    }

    const auto& format = getFormat(mime_type);

    if (!content.includes("data")
            || content.type("data") == lth_jc::DataType::Null) {
        return boost::none;
    }

    return format.decoder(content.get<lth_jc::JsonContainer>("data"));
}

const ContentCodec::Format& ContentCodec::getFormat(const std::string& mime_type) const {
    auto format_it = formats_.find(mime_type);

    if (format_it == formats_.end()) {
        throw unsupported_format_error {
            lth_loc::format("unsupported format '{1}'", mime_type) };
    }

    return format_it->second;
}

namespace Protocol {

const ContentCodec& getContentCodec() {
    static Util::once_flag init_flag;
    static std::unique_ptr<const ContentCodec> codec_ptr { nullptr };

    Util::call_once(init_flag, []() {
        codec_ptr.reset(new ContentCodec());
    });

    return *codec_ptr;
}

lth_jc::JsonContainer encodeContent(
        const boost::optional<lth_jc::JsonContainer>& data,
        const std::string& mime_type) {
    return getContentCodec().encode(data, mime_type);
}

boost::optional<lth_jc::JsonContainer> decodeContent(
        const lth_jc::JsonContainer& content) {
    return getContentCodec().decode(content);
}

boost::optional<lth_jc::JsonContainer> decodeMessageData(
        const Envelope& envelope) {
    return decodeContent(validate(envelope).getContent());
}

}  // namespace Protocol
}  // namespace ZmqPlugin
