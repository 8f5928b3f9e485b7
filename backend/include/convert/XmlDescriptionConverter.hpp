#pragma once
#include <set>
#include <string>
#include <boost/property_tree/ptree_fwd.hpp>
#include "convert/IDescriptionConverter.hpp"

namespace upnpbridge {

// UPnP XML description -> JSON via Boost.PropertyTree.
//
//   text-only element     -> string
//   element with children -> object, repeated names collapse into arrays
//   attribute a           -> "@a" (xmlns declarations dropped)
//   namespace prefixes    -> stripped
//   list containers       -> array of their children (per doc type)
class XmlDescriptionConverter : public IDescriptionConverter {
public:
    nlohmann::json convert(const std::string& source, const std::string& doc_type) const override;

    static const std::set<std::string>& list_containers(const std::string& doc_type);

private:
    static nlohmann::json element_to_json(const boost::property_tree::ptree& node, const std::string& name,
                                          const std::set<std::string>& containers);
};

std::string strip_namespace(const std::string& name);

} // namespace upnpbridge
