#include "orca/core/ids.hpp"

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>

namespace orca {
namespace {

// Fixed namespace for invocation and firing identities
const boost::uuids::uuid& orca_namespace() {
    static const boost::uuids::uuid ns =
        boost::uuids::string_generator()("8a1f4c52-3e0b-5d7a-9c61-2f4e8b7d0a13");
    return ns;
}

} // namespace

std::string new_uuid() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string uuid_from_name(const std::string& name) {
    boost::uuids::name_generator_sha1 generator(orca_namespace());
    return boost::uuids::to_string(generator(name));
}

bool is_uuid(const std::string& text) {
    if (text.size() != 36) {
        return false;
    }
    try {
        boost::uuids::string_generator()(text);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace orca
