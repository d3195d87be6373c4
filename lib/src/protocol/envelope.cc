#include <cpp-zmq-plugin/protocol/envelope.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>

#include <leatherman/locale/locale.hpp>

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

//
// Envelope
//

// Constructors

Envelope::Envelope(lth_jc::JsonContainer json_envelope)
        : envelope_ { std::move(json_envelope) } {
    if (envelope_.type() != lth_jc::DataType::Object) {
        throw message_error {
            lth_loc::translate("invalid message: not a JSON object") };
    }
}

Envelope::Envelope(const std::string& transport_payload)
        : Envelope(lth_jc::JsonContainer(transport_payload)) {
}

Envelope::Envelope(const Header& header,
                   lth_jc::JsonContainer content)
        : envelope_ {} {
    envelope_.set<lth_jc::JsonContainer>("header", header.toJson());
    envelope_.set<lth_jc::JsonContainer>("content", content);
}

Envelope::Envelope(const Header& header,
                   const Header& parent_header,
                   lth_jc::JsonContainer content)
        : Envelope(header, std::move(content)) {
    envelope_.set<lth_jc::JsonContainer>("parent_header", parent_header.toJson());
}

// Getters

Header Envelope::getHeader() const {
    if (!envelope_.includes("header")) {
        throw message_error { lth_loc::translate("message has no header") };
    }

    return Header(envelope_.get<lth_jc::JsonContainer>("header"));
}

Header Envelope::getParentHeader() const {
    if (!hasParentHeader()) {
        throw message_error {
            lth_loc::translate("message has no parent header") };
    }

    return Header(envelope_.get<lth_jc::JsonContainer>("parent_header"));
}

std::string Envelope::getMessageType() const {
    return getHeader().msg_type;
}

lth_jc::JsonContainer Envelope::getContent() const {
    return getObjectEntry("content");
}

lth_jc::JsonContainer Envelope::getMetadata() const {
    return getObjectEntry("metadata");
}

const lth_jc::JsonContainer& Envelope::getJson() const {
    return envelope_;
}

// Inspectors

bool Envelope::hasParentHeader() const {
    return envelope_.includes("parent_header");
}

bool Envelope::hasContent() const {
    return envelope_.includes("content");
}

bool Envelope::hasMetadata() const {
    return envelope_.includes("metadata");
}

// toString

std::string Envelope::toString() const {
    return envelope_.toString();
}

// Private

lth_jc::JsonContainer Envelope::getObjectEntry(const std::string& key) const {
    if (!envelope_.includes(key)
            || envelope_.type(key) != lth_jc::DataType::Object) {
        return lth_jc::JsonContainer {};
    }

    return envelope_.get<lth_jc::JsonContainer>(key);
}

}  // namespace ZmqPlugin
