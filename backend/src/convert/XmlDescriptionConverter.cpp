#include "convert/XmlDescriptionConverter.hpp"
#include "core/ErrorCatalog.hpp"
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace pt = boost::property_tree;
using json = nlohmann::json;

namespace upnpbridge {

namespace {

constexpr const char* XML_ATTR = "<xmlattr>";
constexpr const char* XML_COMMENT = "<xmlcomment>";

bool is_element(const std::string& key) {
    return key != XML_ATTR && key != XML_COMMENT;
}

} // namespace

std::string strip_namespace(const std::string& name) {
    auto colon = name.rfind(':');
    if (colon == std::string::npos) return name;
    return name.substr(colon + 1);
}

const std::set<std::string>& XmlDescriptionConverter::list_containers(const std::string& doc_type) {
    static const std::set<std::string> device{"iconList", "serviceList", "deviceList"};
    static const std::set<std::string> service{"actionList", "argumentList", "serviceStateTable"};
    static const std::set<std::string> none;
    if (doc_type == DOC_TYPE_DEVICE) return device;
    if (doc_type == DOC_TYPE_SERVICE) return service;
    return none;
}

json XmlDescriptionConverter::element_to_json(const pt::ptree& node, const std::string& name,
                                              const std::set<std::string>& containers) {
    if (containers.count(name)) {
        json arr = json::array();
        for (const auto& [key, child] : node) {
            if (!is_element(key)) continue;
            arr.push_back(element_to_json(child, strip_namespace(key), containers));
        }
        return arr;
    }

    json obj = json::object();
    bool has_children = false;

    if (auto attrs = node.get_child_optional(XML_ATTR)) {
        for (const auto& [attr, value] : *attrs) {
            if (boost::starts_with(attr, "xmlns")) continue;
            obj["@" + strip_namespace(attr)] = value.data();
        }
    }

    for (const auto& [key, child] : node) {
        if (!is_element(key)) continue;
        has_children = true;
        const auto child_name = strip_namespace(key);
        auto value = element_to_json(child, child_name, containers);
        auto it = obj.find(child_name);
        if (it == obj.end()) {
            obj[child_name] = std::move(value);
        } else {
            if (!it->is_array()) *it = json::array({*it});
            it->push_back(std::move(value));
        }
    }

    const auto text = boost::trim_copy(node.data());
    if (!has_children && obj.empty()) return text;
    if (!text.empty()) obj["#text"] = text;
    return obj;
}

json XmlDescriptionConverter::convert(const std::string& source, const std::string& doc_type) const {
    if (boost::trim_copy(source).empty()) {
        throw ProxyError(ErrorKind::ConversionFailure, errors::D1450_EMPTY_DOCUMENT);
    }

    pt::ptree tree;
    try {
        std::istringstream in(source);
        pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        throw ProxyError(ErrorKind::ConversionFailure, errors::format_xml_parse_error(e.what()));
    }

    const auto& containers = list_containers(doc_type);
    for (const auto& [key, root] : tree) {
        if (!is_element(key)) continue;
        const auto root_name = strip_namespace(key);
        auto out = element_to_json(root, root_name, containers);
        if (!out.is_object()) return json{{root_name, out}};
        return out;
    }
    throw ProxyError(ErrorKind::ConversionFailure, errors::D1450_NO_ROOT_ELEMENT);
}

} // namespace upnpbridge
