#include <cpp-zmq-plugin/protocol/header.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>

#include <leatherman/locale/locale.hpp>

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

static std::string getEntry(const lth_jc::JsonContainer& json_header,
                            const std::string& key) {
    if (json_header.type() != lth_jc::DataType::Object) {
        throw message_error {
            lth_loc::translate("invalid header: not a JSON object") };
    }

    if (!json_header.includes(key)
            || json_header.type(key) != lth_jc::DataType::String) {
        throw message_error {
            lth_loc::format("invalid header: '{1}' must be a string", key) };
    }

    return json_header.get<std::string>(key);
}

Header::Header(std::string _msg_id,
               std::string _session,
               std::string _date,
               std::string _source,
               std::string _target,
               std::string _msg_type,
               std::string _version)
        : msg_id { std::move(_msg_id) },
          session { std::move(_session) },
          date { std::move(_date) },
          source { std::move(_source) },
          target { std::move(_target) },
          msg_type { std::move(_msg_type) },
          version { std::move(_version) } {
}

Header::Header(const lth_jc::JsonContainer& json_header)
        : Header(getEntry(json_header, "msg_id"),
                 getEntry(json_header, "session"),
                 getEntry(json_header, "date"),
                 getEntry(json_header, "source"),
                 getEntry(json_header, "target"),
                 getEntry(json_header, "msg_type"),
                 getEntry(json_header, "version")) {
}

lth_jc::JsonContainer Header::toJson() const {
    lth_jc::JsonContainer json_header {};
    json_header.set<std::string>("msg_id", msg_id);
    json_header.set<std::string>("session", session);
    json_header.set<std::string>("date", date);
    json_header.set<std::string>("source", source);
    json_header.set<std::string>("target", target);
    json_header.set<std::string>("msg_type", msg_type);
    json_header.set<std::string>("version", version);
    return json_header;
}

std::string Header::toString() const {
    return toJson().toString();
}

bool operator==(const Header& lhs, const Header& rhs) {
    return lhs.msg_id == rhs.msg_id
        && lhs.session == rhs.session
        && lhs.date == rhs.date
        && lhs.source == rhs.source
        && lhs.target == rhs.target
        && lhs.msg_type == rhs.msg_type
        && lhs.version == rhs.version;
}

bool operator!=(const Header& lhs, const Header& rhs) {
    return !(lhs == rhs);
}

}  // namespace ZmqPlugin
