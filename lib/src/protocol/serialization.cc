#include <cpp-zmq-plugin/protocol/serialization.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>

#include <leatherman/locale/locale.hpp>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/serialization/string.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <new>
#include <sstream>
#include <stdexcept>

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

using json_allocator = rapidjson::Document::AllocatorType;

//
// Auxiliary functions
//

static std::string valueToString(const rapidjson::Value& jval) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer { buffer };
    jval.Accept(writer);
    return buffer.GetString();
}

static void setString(rapidjson::Value& jval, const std::string& txt,
                      json_allocator& allocator) {
    jval.SetString(txt.data(), static_cast<rapidjson::SizeType>(txt.size()),
                   allocator);
}

//
// Native object format
//

// Kind tags of the archived values
static const int NATIVE_NULL   { 0 };
static const int NATIVE_BOOL   { 1 };
static const int NATIVE_INT    { 2 };
static const int NATIVE_UINT   { 3 };
static const int NATIVE_DOUBLE { 4 };
static const int NATIVE_STRING { 5 };
static const int NATIVE_ARRAY  { 6 };
static const int NATIVE_OBJECT { 7 };

// Strings are archived as their size followed by their bytes, so that
// a declared size can be checked before allocating

static void saveString(boost::archive::text_oarchive& archive,
                       const char* txt,
                       std::size_t size) {
    const unsigned long long archived_size { size };
    archive << archived_size;

    if (size > 0) {
        archive.save_binary(txt, size);
    }
}

// Throw a data_decoding_error in case the declared size exceeds the
// size of the whole archive
static unsigned long long loadSize(boost::archive::text_iarchive& archive,
                                   std::size_t max_size) {
    unsigned long long size;
    archive >> size;

    if (size > max_size) {
        throw data_decoding_error {
            lth_loc::format("invalid native archive: declared size {1} "
                            "exceeds the archive size", size) };
    }

    return size;
}

static std::string loadString(boost::archive::text_iarchive& archive,
                              std::size_t max_size) {
    auto size = loadSize(archive, max_size);
    std::string txt(static_cast<std::size_t>(size), '\0');

    if (size > 0) {
        archive.load_binary(&txt[0], static_cast<std::size_t>(size));
    }

    return txt;
}

static void saveValue(boost::archive::text_oarchive& archive,
                      const rapidjson::Value& jval) {
    switch (jval.GetType()) {
        case rapidjson::kNullType:
            archive << NATIVE_NULL;
            break;
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:
        {
            const bool flag { jval.GetBool() };
            archive << NATIVE_BOOL << flag;
            break;
        }
        case rapidjson::kNumberType:
            if (jval.IsInt64()) {
                const long long number { jval.GetInt64() };
                archive << NATIVE_INT << number;
            } else if (jval.IsUint64()) {
                const unsigned long long number { jval.GetUint64() };
                archive << NATIVE_UINT << number;
            } else {
                const double number { jval.GetDouble() };
                archive << NATIVE_DOUBLE << number;
            }
            break;
        case rapidjson::kStringType:
            archive << NATIVE_STRING;
            saveString(archive, jval.GetString(), jval.GetStringLength());
            break;
        case rapidjson::kArrayType:
        {
            const unsigned int size { jval.Size() };
            archive << NATIVE_ARRAY << size;
            for (auto item = jval.Begin(); item != jval.End(); ++item) {
                saveValue(archive, *item);
            }
            break;
        }
        case rapidjson::kObjectType:
        {
            const unsigned int size { jval.MemberCount() };
            archive << NATIVE_OBJECT << size;
            for (auto member = jval.MemberBegin(); member != jval.MemberEnd(); ++member) {
                saveString(archive, member->name.GetString(),
                           member->name.GetStringLength());
                saveValue(archive, member->value);
            }
            break;
        }
    }
}

static void loadValue(boost::archive::text_iarchive& archive,
                      rapidjson::Value& jval,
                      json_allocator& allocator,
                      std::size_t max_size) {
    int kind;
    archive >> kind;

    switch (kind) {
        case NATIVE_NULL:
            jval.SetNull();
            break;
        case NATIVE_BOOL:
        {
            bool flag;
            archive >> flag;
            jval.SetBool(flag);
            break;
        }
        case NATIVE_INT:
        {
            long long number;
            archive >> number;
            jval.SetInt64(number);
            break;
        }
        case NATIVE_UINT:
        {
            unsigned long long number;
            archive >> number;
            jval.SetUint64(number);
            break;
        }
        case NATIVE_DOUBLE:
        {
            double number;
            archive >> number;
            jval.SetDouble(number);
            break;
        }
        case NATIVE_STRING:
            setString(jval, loadString(archive, max_size), allocator);
            break;
        case NATIVE_ARRAY:
        {
            auto size = loadSize(archive, max_size);
            jval.SetArray();
            for (unsigned long long idx = 0; idx < size; idx++) {
                rapidjson::Value item {};
                loadValue(archive, item, allocator, max_size);
                jval.PushBack(item, allocator);
            }
            break;
        }
        case NATIVE_OBJECT:
        {
            auto size = loadSize(archive, max_size);
            jval.SetObject();
            for (unsigned long long idx = 0; idx < size; idx++) {
                rapidjson::Value key {};
                setString(key, loadString(archive, max_size), allocator);
                rapidjson::Value member {};
                loadValue(archive, member, allocator, max_size);
                jval.AddMember(key, member, allocator);
            }
            break;
        }
        default:
            throw data_decoding_error {
                lth_loc::format("invalid native archive: unknown value kind {1}",
                                kind) };
    }
}

std::string serializeNative(const lth_jc::JsonContainer& value) {
    std::ostringstream archive_stream {};

    {
        boost::archive::text_oarchive archive { archive_stream };
        saveValue(archive, value.getRaw());
    }

    return archive_stream.str();
}

lth_jc::JsonContainer deserializeNative(const std::string& archive_txt) {
    std::istringstream archive_stream { archive_txt };
    rapidjson::Document document {};

    try {
        boost::archive::text_iarchive archive { archive_stream };
        loadValue(archive, document, document.GetAllocator(),
                  archive_txt.size());
    } catch (const boost::archive::archive_exception& e) {
        throw data_decoding_error {
            lth_loc::format("invalid native archive: {1}", e.what()) };
    } catch (const std::bad_alloc& e) {
        throw data_decoding_error {
            lth_loc::format("invalid native archive: {1}", e.what()) };
    } catch (const std::length_error& e) {
        throw data_decoding_error {
            lth_loc::format("invalid native archive: {1}", e.what()) };
    }

    return lth_jc::JsonContainer { document };
}

//
// YAML
//

static void emitValue(YAML::Emitter& out, const rapidjson::Value& jval) {
    switch (jval.GetType()) {
        case rapidjson::kNullType:
            out << YAML::Null;
            break;
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:
            out << jval.GetBool();
            break;
        case rapidjson::kNumberType:
            // JSON number text; doubles keep the decimal point
            out << valueToString(jval);
            break;
        case rapidjson::kStringType:
            out << YAML::DoubleQuoted
                << std::string(jval.GetString(), jval.GetStringLength());
            break;
        case rapidjson::kArrayType:
            out << YAML::BeginSeq;
            for (auto item = jval.Begin(); item != jval.End(); ++item) {
                emitValue(out, *item);
            }
            out << YAML::EndSeq;
            break;
        case rapidjson::kObjectType:
            out << YAML::BeginMap;
            for (auto member = jval.MemberBegin(); member != jval.MemberEnd(); ++member) {
                out << YAML::Key << YAML::DoubleQuoted
                    << std::string(member->name.GetString(),
                                   member->name.GetStringLength());
                out << YAML::Value;
                emitValue(out, member->value);
            }
            out << YAML::EndMap;
            break;
    }
}

static bool isNullScalar(const std::string& scalar) {
    return scalar.empty() || scalar == "~" || scalar == "null"
        || scalar == "Null" || scalar == "NULL";
}

// Plain (unquoted) scalars are resolved as null, boolean, integer or
// floating point, in this order, and as string otherwise
static void setPlainScalar(const YAML::Node& node,
                           rapidjson::Value& jval,
                           json_allocator& allocator) {
    bool flag;
    long long integer;
    unsigned long long u_integer;
    double number;

    if (isNullScalar(node.Scalar())) {
        jval.SetNull();
    } else if (YAML::convert<bool>::decode(node, flag)) {
        jval.SetBool(flag);
    } else if (YAML::convert<long long>::decode(node, integer)) {
        jval.SetInt64(integer);
    } else if (YAML::convert<unsigned long long>::decode(node, u_integer)) {
        jval.SetUint64(u_integer);
    } else if (YAML::convert<double>::decode(node, number)) {
        jval.SetDouble(number);
    } else {
        setString(jval, node.Scalar(), allocator);
    }
}

static void readNode(const YAML::Node& node,
                     rapidjson::Value& jval,
                     json_allocator& allocator) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            jval.SetNull();
            break;
        case YAML::NodeType::Scalar:
            // quoted scalars are tagged "!"
            if (node.Tag() == "!") {
                setString(jval, node.Scalar(), allocator);
            } else {
                setPlainScalar(node, jval, allocator);
            }
            break;
        case YAML::NodeType::Sequence:
            jval.SetArray();
            for (auto item = node.begin(); item != node.end(); ++item) {
                rapidjson::Value item_jval {};
                readNode(*item, item_jval, allocator);
                jval.PushBack(item_jval, allocator);
            }
            break;
        case YAML::NodeType::Map:
            jval.SetObject();
            for (auto entry = node.begin(); entry != node.end(); ++entry) {
                if (!entry->first.IsScalar()) {
                    throw data_decoding_error {
                        lth_loc::translate("invalid YAML data: mapping keys "
                                           "must be scalars") };
                }
                rapidjson::Value key {};
                setString(key, entry->first.Scalar(), allocator);
                rapidjson::Value member {};
                readNode(entry->second, member, allocator);
                jval.AddMember(key, member, allocator);
            }
            break;
    }
}

std::string serializeYaml(const lth_jc::JsonContainer& value) {
    YAML::Emitter out {};
    emitValue(out, value.getRaw());

    if (!out.good()) {
        throw message_error {
            lth_loc::format("failed to emit YAML data: {1}", out.GetLastError()) };
    }

    return out.c_str();
}

lth_jc::JsonContainer deserializeYaml(const std::string& yaml_txt) {
    rapidjson::Document document {};

    try {
        auto node = YAML::Load(yaml_txt);
        readNode(node, document, document.GetAllocator());
    } catch (const YAML::Exception& e) {
        throw data_decoding_error {
            lth_loc::format("invalid YAML data: {1}", e.what()) };
    }

    return lth_jc::JsonContainer { document };
}

//
// JSON
//

std::string serializeJson(const lth_jc::JsonContainer& value) {
    return value.toString();
}

lth_jc::JsonContainer deserializeJson(const std::string& json_txt) {
    try {
        return lth_jc::JsonContainer { json_txt };
    } catch (const lth_jc::data_parse_error& e) {
        throw data_decoding_error {
            lth_loc::format("invalid JSON data: {1}", e.what()) };
    }
}

//
// String values
//

lth_jc::JsonContainer makeStringValue(const std::string& txt) {
    rapidjson::Document document {};
    setString(document, txt, document.GetAllocator());
    return lth_jc::JsonContainer { document };
}

std::string getStringValue(const lth_jc::JsonContainer& value) {
    const rapidjson::Value& jval = value.getRaw();

    if (!jval.IsString()) {
        throw data_decoding_error {
            lth_loc::translate("encoded data must be a string") };
    }

    return std::string(jval.GetString(), jval.GetStringLength());
}

}  // namespace ZmqPlugin
