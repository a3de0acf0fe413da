#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>

namespace dlnacast {
namespace upnp {

namespace xmlns {
constexpr const char* DEVICE = "urn:schemas-upnp-org:device-1-0";
constexpr const char* SOAP_ENVELOPE = "http://schemas.xmlsoap.org/soap/envelope/";
constexpr const char* AV_TRANSPORT = "urn:schemas-upnp-org:service:AVTransport:1";
constexpr const char* CONNECTION_MANAGER = "urn:schemas-upnp-org:service:ConnectionManager:1";
}

/**
 * @brief Element of a parsed XML tree
 *
 * Names are split into namespace URI and local name. An element outside any
 * namespace has an empty namespaceUri.
 */
class XmlElement {
public:
    std::string namespaceUri;
    std::string localName;
    std::map<std::string, std::string> attributes;
    std::string text;
    std::vector<std::unique_ptr<XmlElement>> children;
    XmlElement* parent = nullptr;

    // First descendant (depth first, document order) in the given namespace
    const XmlElement* findFirst(const std::string& ns, const std::string& name) const;

    // First descendant with that local name in any namespace
    const XmlElement* findFirstAnyNs(const std::string& name) const;

    // Namespace-qualified lookup first, then an element without namespace
    const XmlElement* findQualifiedOrPlain(const std::string& ns, const std::string& name) const;

    std::vector<const XmlElement*> findAll(const std::string& ns, const std::string& name) const;

    const XmlElement* child(const std::string& ns, const std::string& name) const;

    // Trimmed text of findQualifiedOrPlain(), empty when absent
    std::string childText(const std::string& ns, const std::string& name) const;

    std::string trimmedText() const;

private:
    const XmlElement* findIf(const std::function<bool(const XmlElement&)>& match) const;
    void collectIf(const std::function<bool(const XmlElement&)>& match,
                   std::vector<const XmlElement*>& out) const;
};

/**
 * @brief Namespace-aware XML tree built with expat
 */
class XmlDocument {
public:
    // Returns nullptr on malformed input; the reason goes to errorOut
    static std::unique_ptr<XmlDocument> parse(const std::string& xml,
                                              std::string* errorOut = nullptr);

    const XmlElement* root() const { return root_.get(); }

private:
    std::unique_ptr<XmlElement> root_;
};

std::string xmlEscape(const std::string& text);

} // namespace upnp
} // namespace dlnacast
