#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ENVELOPE_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ENVELOPE_H_

#include <cpp-zmq-plugin/protocol/header.hpp>
#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <string>

namespace ZmqPlugin {

//
// Envelope
//

class LIBCPP_ZMQ_PLUGIN_EXPORT Envelope {
  public:
    // The default ctor is deleted since a valid message must have a
    // header (invariant)
    Envelope() = delete;

    // Wrap the JSON object of a message.
    // Throw a message_error in case the value is not a JSON object.
    explicit Envelope(lth_jc::JsonContainer json_envelope);

    // Construct an Envelope by parsing the payload delivered by the
    // transport layer as a std::string.
    //
    // Throw a data_parse_error in case of invalid JSON text.
    // Throw a message_error in case the text is not a JSON object.
    explicit Envelope(const std::string& transport_payload);

    // Create a new message; no parent header nor metadata.
    Envelope(const Header& header,
             lth_jc::JsonContainer content);

    // ... and a parent header, as for replies
    Envelope(const Header& header,
             const Header& parent_header,
             lth_jc::JsonContainer content);

    // Getters; the header ones throw a message_error in case the
    // entry is missing or malformed.
    Header getHeader() const;
    Header getParentHeader() const;
    std::string getMessageType() const;

    // Return an empty JSON object in case the entry is missing.
    lth_jc::JsonContainer getContent() const;
    lth_jc::JsonContainer getMetadata() const;

    const lth_jc::JsonContainer& getJson() const;

    // Inspectors
    bool hasParentHeader() const;
    bool hasContent() const;
    bool hasMetadata() const;

    // Return the JSON text of the message.
    std::string toString() const;

  private:
    lth_jc::JsonContainer envelope_;

    lth_jc::JsonContainer getObjectEntry(const std::string& key) const;
};

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ENVELOPE_H_
