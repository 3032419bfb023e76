#include "infrastructure/network/NmapXmlParser.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>

namespace netsentry::infra {

namespace {

std::string decodeEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        auto end = text.find(';', i);
        if (end == std::string::npos) {
            out.push_back(text[i]);
            continue;
        }
        std::string entity = text.substr(i + 1, end - i - 1);
        if (entity == "amp") {
            out.push_back('&');
        } else if (entity == "lt") {
            out.push_back('<');
        } else if (entity == "gt") {
            out.push_back('>');
        } else if (entity == "quot") {
            out.push_back('"');
        } else if (entity == "apos") {
            out.push_back('\'');
        } else {
            out.append(text, i, end - i + 1);
        }
        i = end;
    }
    return out;
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':' ||
           c == '.';
}

// Recursive-descent reader over the document; failures set ok_ to false.
class XmlReader {
public:
    explicit XmlReader(const std::string& text) : text_(text) {}

    std::optional<XmlElement> readDocument() {
        skipMisc();
        if (!startsWith("<")) {
            return std::nullopt;
        }
        XmlElement root;
        if (!readElement(root, 0)) {
            return std::nullopt;
        }
        skipMisc();
        if (pos_ != text_.size()) {
            return std::nullopt;
        }
        return root;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    bool startsWith(const char* prefix) const {
        return text_.compare(pos_, std::strlen(prefix), prefix) == 0;
    }

    void skipWhitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool skipPast(const char* terminator) {
        auto end = text_.find(terminator, pos_);
        if (end == std::string::npos) {
            pos_ = text_.size();
            return false;
        }
        pos_ = end + std::strlen(terminator);
        return true;
    }

    // Skips whitespace, comments, processing instructions and DOCTYPE.
    bool skipMisc() {
        while (true) {
            skipWhitespace();
            if (startsWith("<?")) {
                if (!skipPast("?>")) {
                    return false;
                }
            } else if (startsWith("<!--")) {
                if (!skipPast("-->")) {
                    return false;
                }
            } else if (startsWith("<!")) {
                if (!skipPast(">")) {
                    return false;
                }
            } else {
                return true;
            }
        }
    }

    std::string readName() {
        size_t start = pos_;
        while (pos_ < text_.size() && isNameChar(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    bool readElement(XmlElement& element, int depth) {
        if (depth > MAX_DEPTH || !startsWith("<")) {
            return false;
        }
        ++pos_;
        element.name = readName();
        if (element.name.empty()) {
            return false;
        }

        // Attributes
        while (true) {
            skipWhitespace();
            if (pos_ >= text_.size()) {
                return false;
            }
            if (startsWith("/>")) {
                pos_ += 2;
                return true;
            }
            if (text_[pos_] == '>') {
                ++pos_;
                break;
            }
            std::string key = readName();
            if (key.empty()) {
                return false;
            }
            skipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != '=') {
                return false;
            }
            ++pos_;
            skipWhitespace();
            if (pos_ >= text_.size() || (text_[pos_] != '"' && text_[pos_] != '\'')) {
                return false;
            }
            char quote = text_[pos_++];
            auto end = text_.find(quote, pos_);
            if (end == std::string::npos) {
                return false;
            }
            element.attributes[key] = decodeEntities(text_.substr(pos_, end - pos_));
            pos_ = end + 1;
        }

        // Content
        while (true) {
            auto next = text_.find('<', pos_);
            if (next == std::string::npos) {
                return false;
            }
            pos_ = next;
            if (startsWith("</")) {
                pos_ += 2;
                std::string closing = readName();
                skipWhitespace();
                if (closing != element.name || pos_ >= text_.size() || text_[pos_] != '>') {
                    return false;
                }
                ++pos_;
                return true;
            }
            if (startsWith("<!--")) {
                if (!skipPast("-->")) {
                    return false;
                }
                continue;
            }
            if (startsWith("<![CDATA[")) {
                if (!skipPast("]]>")) {
                    return false;
                }
                continue;
            }
            if (startsWith("<?")) {
                if (!skipPast("?>")) {
                    return false;
                }
                continue;
            }
            XmlElement child;
            if (!readElement(child, depth + 1)) {
                return false;
            }
            element.children.push_back(std::move(child));
        }
    }

    const std::string& text_;
    size_t pos_{0};
};

} // namespace

const XmlElement* XmlElement::child(const std::string& childName) const {
    for (const auto& c : children) {
        if (c.name == childName) {
            return &c;
        }
    }
    return nullptr;
}

std::vector<const XmlElement*> XmlElement::childrenNamed(const std::string& childName) const {
    std::vector<const XmlElement*> matches;
    for (const auto& c : children) {
        if (c.name == childName) {
            matches.push_back(&c);
        }
    }
    return matches;
}

std::string XmlElement::attribute(const std::string& key, const std::string& fallback) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : fallback;
}

std::optional<XmlElement> NmapXmlParser::parseXml(const std::string& xml) {
    XmlReader reader(xml);
    return reader.readDocument();
}

std::optional<core::NetworkScanResult> NmapXmlParser::parse(const std::string& xml) {
    auto root = parseXml(xml);
    if (!root || root->name != "nmaprun") {
        spdlog::warn("nmap output could not be parsed");
        return std::nullopt;
    }

    core::NetworkScanResult result;
    result.strategy = "nmap";
    int hostEntries = 0;

    for (const auto* host : root->childrenNamed("host")) {
        ++hostEntries;
        const auto* status = host->child("status");
        if (!status || status->attribute("state") != "up") {
            continue;
        }

        std::string ip;
        for (const auto* address : host->childrenNamed("address")) {
            if (address->attribute("addrtype") == "ipv4") {
                ip = address->attribute("addr");
                break;
            }
        }
        if (ip.empty()) {
            continue;
        }

        core::LiveHost live;
        live.address = ip;

        if (const auto* hostnames = host->child("hostnames")) {
            if (const auto* hostname = hostnames->child("hostname")) {
                auto name = hostname->attribute("name");
                if (!name.empty()) {
                    live.hostname = name;
                }
            }
        }

        if (const auto* times = host->child("times")) {
            try {
                auto srtt = std::stod(times->attribute("srtt", "0"));
                live.responseTimeMs = srtt > 0 ? srtt / 1000.0 : 0.0;
            } catch (const std::exception&) {
                live.responseTimeMs = 0.0;
            }
        }

        auto& ports = result.portResults[ip];
        if (const auto* portList = host->child("ports")) {
            for (const auto* port : portList->childrenNamed("port")) {
                if (port->attribute("protocol", "tcp") != "tcp") {
                    continue;
                }
                const auto* state = port->child("state");
                try {
                    auto number = std::stoul(port->attribute("portid"));
                    if (number == 0 || number > 65535) {
                        continue;
                    }
                    ports[static_cast<uint16_t>(number)] =
                        state != nullptr && state->attribute("state") == "open";
                } catch (const std::exception&) {
                    spdlog::debug("Skipping nmap port entry without a valid portid");
                }
            }
        }

        result.aliveHosts.push_back(std::move(live));
    }

    result.totalHosts = hostEntries;
    if (const auto* runstats = root->child("runstats")) {
        if (const auto* hosts = runstats->child("hosts")) {
            try {
                result.totalHosts = std::stoi(hosts->attribute("total", std::to_string(hostEntries)));
            } catch (const std::exception&) {
                result.totalHosts = hostEntries;
            }
        }
    }

    return result;
}

} // namespace netsentry::infra
