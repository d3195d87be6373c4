#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_CONTENT_CODEC_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_CONTENT_CODEC_H_

#include <cpp-zmq-plugin/protocol/envelope.hpp>
#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <boost/optional.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ZmqPlugin {
namespace Protocol {

//
// Payload formats (mime types)
//

static const std::string NATIVE_MIME_TYPE       { "application/x-boost-serialization" };
static const std::string YAML_MIME_TYPE         { "application/x-yaml" };
static const std::string JSON_MIME_TYPE         { "application/json" };
static const std::string OCTET_STREAM_MIME_TYPE { "application/octet-stream" };
static const std::string TEXT_MIME_TYPE         { "text/plain" };

// No format: the payload is stored as is and no mime type is stamped
static const std::string NO_MIME_TYPE {};

// Assumed in case the content metadata does not indicate a mime type
static const std::string DEFAULT_MIME_TYPE { NATIVE_MIME_TYPE };

}  // namespace Protocol

//
// ContentCodec
//

class LIBCPP_ZMQ_PLUGIN_EXPORT ContentCodec {
  public:
    // Map a payload value to the value stored in content.data and back
    using Encoder = std::function<lth_jc::JsonContainer(const lth_jc::JsonContainer&)>;
    using Decoder = std::function<lth_jc::JsonContainer(const lth_jc::JsonContainer&)>;

    // Instantiate a codec supporting the native, YAML, JSON,
    // octet-stream and plain text formats.
    ContentCodec();

    // Throw a format_redefinition_error in case the format is already
    // supported or is NO_MIME_TYPE.
    void registerFormat(const std::string& mime_type,
                        Encoder encoder,
                        Decoder decoder);

    bool supportsFormat(const std::string& mime_type) const;
    std::vector<std::string> getFormats() const;

    // Return the content entries carrying the payload: 'data' and,
    // unless the format is NO_MIME_TYPE, 'metadata.mime_type'. No
    // entry is returned in case data is none.
    //
    // Throw an unsupported_format_error in case of unknown format.
    lth_jc::JsonContainer encode(
        const boost::optional<lth_jc::JsonContainer>& data,
        const std::string& mime_type = Protocol::DEFAULT_MIME_TYPE) const;

    // Return the payload stored in the content; none in case the
    // content has no data.
    //
    // Throw a remote_error in case the content has an 'error' entry,
    // whatever the status of the message.
    // Throw an unsupported_format_error in case of unknown format or
    // in case metadata.mime_type is not a string.
    // Throw a data_decoding_error in case the data cannot be decoded.
    boost::optional<lth_jc::JsonContainer> decode(
        const lth_jc::JsonContainer& content) const;

  private:
    struct Format {
        Encoder encoder;
        Decoder decoder;
    };

    std::map<std::string, Format> formats_;

    const Format& getFormat(const std::string& mime_type) const;
};

namespace Protocol {

// Process-wide codec with the built-in formats; instantiated at the
// first call, read-only afterwards.
LIBCPP_ZMQ_PLUGIN_EXPORT const ContentCodec& getContentCodec();

LIBCPP_ZMQ_PLUGIN_EXPORT lth_jc::JsonContainer encodeContent(
    const boost::optional<lth_jc::JsonContainer>& data,
    const std::string& mime_type = DEFAULT_MIME_TYPE);

LIBCPP_ZMQ_PLUGIN_EXPORT boost::optional<lth_jc::JsonContainer> decodeContent(
    const lth_jc::JsonContainer& content);

// Validate the message (see Protocol::validate) and decode the
// payload of its content.
LIBCPP_ZMQ_PLUGIN_EXPORT boost::optional<lth_jc::JsonContainer> decodeMessageData(
    const Envelope& envelope);

}  // namespace Protocol
}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_CONTENT_CODEC_H_
