#pragma once

#include "core/types/ScanJob.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief A parsed XML element. Text content is not retained.
 */
struct XmlElement {
    std::string name;                              ///< Tag name
    std::map<std::string, std::string> attributes; ///< Attributes with entities decoded
    std::vector<XmlElement> children;              ///< Child elements in document order

    /**
     * @brief Returns the first child with the given name, or nullptr.
     */
    const XmlElement* child(const std::string& childName) const;

    /**
     * @brief Returns all children with the given name.
     */
    std::vector<const XmlElement*> childrenNamed(const std::string& childName) const;

    /**
     * @brief Returns an attribute value, or fallback when absent.
     */
    std::string attribute(const std::string& key, const std::string& fallback = "") const;
};

/**
 * @brief Parser for nmap's XML report (-oX).
 *
 * Handles the subset of XML nmap emits: a prolog, processing instructions,
 * a DOCTYPE, comments, and elements with quoted attributes.
 */
class NmapXmlParser {
public:
    /**
     * @brief Parses an XML document into an element tree.
     * @param xml Document text.
     * @return The root element, or std::nullopt if the document is malformed.
     */
    static std::optional<XmlElement> parseXml(const std::string& xml);

    /**
     * @brief Converts an nmap report into a scan result.
     *
     * Hosts whose status is "up" with an IPv4 address become live hosts;
     * times@srtt (microseconds) gives the response time. Port entries are
     * recorded as open or not open.
     *
     * @param xml nmap XML output.
     * @return The scan result, or std::nullopt if the report is malformed.
     */
    static std::optional<core::NetworkScanResult> parse(const std::string& xml);
};

} // namespace netsentry::infra
