#include <cpp-zmq-plugin/protocol/validation.hpp>
#include <cpp-zmq-plugin/protocol/schemas.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>
#include <cpp-zmq-plugin/util/thread.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".validation"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>

#include <memory>

namespace ZmqPlugin {
namespace Protocol {

namespace lth_loc = leatherman::locale;

const Validator& getMessageValidator() {
    static Util::once_flag init_flag;
    static std::unique_ptr<const Validator> validator_ptr { nullptr };

    Util::call_once(init_flag, []() {
        validator_ptr.reset(new Validator(getSchemaRegistry().buildValidator()));
        LOG_DEBUG("Message validators compiled");
    });

    return *validator_ptr;
}

const Envelope& validate(const Envelope& envelope) {
    return validate(envelope, getMessageValidator());
}

const Envelope& validate(const Envelope& envelope, const Validator& validator) {
    validator.validate(envelope.getJson(), BASE_MESSAGE_SCHEMA_NAME);

    // Valid as a base message; now validate as the specific type
    auto msg_type = envelope.getMessageType();

    if (!validator.includesSchema(msg_type)) {
        throw unknown_message_type_error {
            lth_loc::format("unknown message type '{1}'", msg_type) };
    }

    validator.validate(envelope.getJson(), msg_type);
    LOG_TRACE("Valid {1} message {2}", msg_type, envelope.getHeader().msg_id);
    return envelope;
}

}  // namespace Protocol
}  // namespace ZmqPlugin
