#ifndef UUID_JSON_HPP
#define UUID_JSON_HPP
#include "../uuid/uuid.hpp"
#include <boost/json.hpp>

namespace UUID{
    // boost::json::value_from(uuid) yields the canonical string.
    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Uuid& uuid);

    // boost::json::value_to<Uuid>(jv) accepts only a canonical uuid string.
    // Throws std::invalid_argument otherwise.
    Uuid tag_invoke(const boost::json::value_to_tag<Uuid>&, const boost::json::value& jv);

    // Every representation of every field, keyed by field name:
    // {"hex_string":..., "bit_string":..., "version":...,
    //  "int_fields":{...}, "bit_fields":{...}, "hex_fields":{...}}
    boost::json::object describe(const Uuid& uuid);
}// uuid namespace
#endif
