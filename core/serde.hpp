#pragma once

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <sstream>
#include <string>

namespace splinerig::core::serde {

using Fghj = boost::property_tree::ptree;
// Empty on success, otherwise the reason the document was rejected.
using SerdeException = std::optional<std::string>;

inline SerdeException parseJson(const std::string& text, Fghj& out) {
    try {
        std::stringstream ss(text);
        boost::property_tree::read_json(ss, out);
    } catch (const boost::property_tree::json_parser_error& ex) {
        return std::string("json parse error: ") + ex.what();
    }
    return std::nullopt;
}

inline std::string writeJson(const Fghj& doc, bool pretty) {
    std::stringstream ss;
    boost::property_tree::write_json(ss, doc, pretty);
    return ss.str();
}

} // namespace splinerig::core::serde
