#include "uuid-json.hpp"
#include <stdexcept>

namespace UUID{
    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Uuid& uuid){
        jv = boost::json::string(uuid.str());
    }

    Uuid tag_invoke(const boost::json::value_to_tag<Uuid>&, const boost::json::value& jv){
        if(!jv.is_string()){
            throw std::invalid_argument("uuid must be a json string.");
        }
        const boost::json::string& str = jv.get_string();
        std::optional<Uuid> uuid = parse(std::string_view(str.data(), str.size()));
        if(!uuid){
            throw std::invalid_argument("malformed uuid string: " + std::string(str.data(), str.size()));
        }
        return *uuid;
    }

    boost::json::object describe(const Uuid& uuid){
        boost::json::object int_fields;
        boost::json::object bit_fields;
        boost::json::object hex_fields;
        for(std::size_t i=0; i < Uuid::num_fields; ++i){
            Field field = uuid[i];
            boost::json::string_view name(Uuid::field_names[i].data(), Uuid::field_names[i].size());
            int_fields.emplace(name, field.value);
            bit_fields.emplace(name, boost::json::string(field.bits()));
            hex_fields.emplace(name, boost::json::string(field.hex()));
        }
        boost::json::object jo;
        jo.emplace("hex_string", boost::json::string(uuid.hex_string()));
        jo.emplace("bit_string", boost::json::string(uuid.bit_string()));
        jo.emplace("version", uuid.version());
        jo.emplace("int_fields", std::move(int_fields));
        jo.emplace("bit_fields", std::move(bit_fields));
        jo.emplace("hex_fields", std::move(hex_fields));
        return jo;
    }
}// uuid namespace
