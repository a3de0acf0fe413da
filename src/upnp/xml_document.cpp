#include "upnp/xml_document.hpp"

#include <cctype>
#include <cstring>

#include <expat.h>

namespace dlnacast {
namespace upnp {

namespace {

constexpr char NS_SEPARATOR = '|';

void splitName(const XML_Char* name, std::string& ns, std::string& local) {
    const char* sep = std::strchr(name, NS_SEPARATOR);
    if (sep == nullptr) {
        ns.clear();
        local = name;
    } else {
        ns.assign(name, sep - name);
        local = sep + 1;
    }
}

struct TreeBuilder {
    std::unique_ptr<XmlElement> root;
    XmlElement* current = nullptr;

    static void startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
        auto* self = static_cast<TreeBuilder*>(userData);

        auto element = std::make_unique<XmlElement>();
        splitName(name, element->namespaceUri, element->localName);
        for (int i = 0; atts[i] != nullptr && atts[i + 1] != nullptr; i += 2) {
            std::string attrNs;
            std::string attrLocal;
            splitName(atts[i], attrNs, attrLocal);
            element->attributes[attrLocal] = atts[i + 1];
        }

        XmlElement* raw = element.get();
        if (self->current == nullptr) {
            self->root = std::move(element);
        } else {
            raw->parent = self->current;
            self->current->children.push_back(std::move(element));
        }
        self->current = raw;
    }

    static void endElement(void* userData, const XML_Char*) {
        auto* self = static_cast<TreeBuilder*>(userData);
        if (self->current != nullptr) {
            self->current = self->current->parent;
        }
    }

    static void characterData(void* userData, const XML_Char* s, int len) {
        auto* self = static_cast<TreeBuilder*>(userData);
        if (self->current != nullptr && s != nullptr && len > 0) {
            self->current->text.append(s, static_cast<size_t>(len));
        }
    }
};

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

const XmlElement* XmlElement::findIf(const std::function<bool(const XmlElement&)>& match) const {
    for (const auto& childElement : children) {
        if (match(*childElement)) {
            return childElement.get();
        }
        if (const XmlElement* found = childElement->findIf(match)) {
            return found;
        }
    }
    return nullptr;
}

void XmlElement::collectIf(const std::function<bool(const XmlElement&)>& match,
                           std::vector<const XmlElement*>& out) const {
    for (const auto& childElement : children) {
        if (match(*childElement)) {
            out.push_back(childElement.get());
        }
        childElement->collectIf(match, out);
    }
}

const XmlElement* XmlElement::findFirst(const std::string& ns, const std::string& name) const {
    return findIf([&](const XmlElement& e) {
        return e.namespaceUri == ns && e.localName == name;
    });
}

const XmlElement* XmlElement::findFirstAnyNs(const std::string& name) const {
    return findIf([&](const XmlElement& e) { return e.localName == name; });
}

const XmlElement* XmlElement::findQualifiedOrPlain(const std::string& ns, const std::string& name) const {
    if (const XmlElement* qualified = findFirst(ns, name)) {
        return qualified;
    }
    return findFirst(std::string(), name);
}

std::vector<const XmlElement*> XmlElement::findAll(const std::string& ns, const std::string& name) const {
    std::vector<const XmlElement*> result;
    collectIf([&](const XmlElement& e) {
        return e.namespaceUri == ns && e.localName == name;
    }, result);
    return result;
}

const XmlElement* XmlElement::child(const std::string& ns, const std::string& name) const {
    for (const auto& childElement : children) {
        if (childElement->namespaceUri == ns && childElement->localName == name) {
            return childElement.get();
        }
    }
    return nullptr;
}

std::string XmlElement::childText(const std::string& ns, const std::string& name) const {
    const XmlElement* element = findQualifiedOrPlain(ns, name);
    return element != nullptr ? element->trimmedText() : std::string();
}

std::string XmlElement::trimmedText() const {
    return trim(text);
}

std::unique_ptr<XmlDocument> XmlDocument::parse(const std::string& xml, std::string* errorOut) {
    XML_Parser parser = XML_ParserCreateNS(nullptr, NS_SEPARATOR);
    if (parser == nullptr) {
        if (errorOut) *errorOut = "XML_ParserCreateNS failed";
        return nullptr;
    }

    TreeBuilder builder;
    XML_SetUserData(parser, &builder);
    XML_SetElementHandler(parser, &TreeBuilder::startElement, &TreeBuilder::endElement);
    XML_SetCharacterDataHandler(parser, &TreeBuilder::characterData);

    XML_Status status = XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);
    if (status != XML_STATUS_OK) {
        if (errorOut) {
            *errorOut = std::string(XML_ErrorString(XML_GetErrorCode(parser))) +
                        " at line " + std::to_string(XML_GetCurrentLineNumber(parser));
        }
        XML_ParserFree(parser);
        return nullptr;
    }
    XML_ParserFree(parser);

    if (!builder.root) {
        if (errorOut) *errorOut = "empty document";
        return nullptr;
    }

    auto document = std::unique_ptr<XmlDocument>(new XmlDocument());
    document->root_ = std::move(builder.root);
    return document;
}

std::string xmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace upnp
} // namespace dlnacast
