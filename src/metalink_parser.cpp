#include <algorithm>
#include <climits>
#include <fstream>
#include <memory>
#include <regex>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <spdlog/spdlog.h>

#include <metaloader/metalink_parser.hpp>
#include <metaloader/url.hpp>
#include <metaloader/utils.hpp>

namespace metaloader
{
    namespace
    {
        using xml_doc_ptr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

        tl::unexpected<ParseError> fail(ParseErrorKind kind,
                                        std::string field,
                                        std::string reason = {})
        {
            return tl::unexpected(ParseError{ kind, std::move(field), std::move(reason) });
        }

        tl::unexpected<ParseError> missing(std::string field)
        {
            return fail(ParseErrorKind::kMISSING_REQUIRED_FIELD, std::move(field));
        }

        tl::unexpected<ParseError> invalid(std::string field, std::string reason)
        {
            return fail(ParseErrorKind::kINVALID_VALUE, std::move(field), std::move(reason));
        }

        bool is_metalink_element(const xmlNode* node)
        {
            return node->type == XML_ELEMENT_NODE && node->ns != nullptr
                   && xmlStrEqual(node->ns->href, BAD_CAST METALINK_NAMESPACE);
        }

        bool has_name(const xmlNode* node, const char* name)
        {
            return xmlStrEqual(node->name, BAD_CAST name);
        }

        std::string text(const xmlNode* node)
        {
            xmlChar* content = xmlNodeGetContent(node);
            if (!content)
                return {};
            std::string res = strip(reinterpret_cast<const char*>(content));
            xmlFree(content);
            return res;
        }

        std::optional<std::string> attribute(const xmlNode* node, const char* name)
        {
            xmlChar* value = xmlGetNoNsProp(node, BAD_CAST name);
            if (!value)
                return std::nullopt;
            std::string res = strip(reinterpret_cast<const char*>(value));
            xmlFree(value);
            return res;
        }

        tl::expected<std::optional<std::uint32_t>, ParseError> uint_attribute(
            const xmlNode* node, const char* element, const char* name, std::uint64_t min_value,
            std::uint64_t max_value)
        {
            auto raw = attribute(node, name);
            if (!raw)
                return std::optional<std::uint32_t>();

            const std::string field = fmt::format("{}@{}", element, name);
            auto value = parse_uint(*raw);
            if (!value)
                return invalid(field, fmt::format("'{}' is not a decimal integer", *raw));
            if (*value < min_value || *value > max_value)
            {
                return invalid(
                    field,
                    fmt::format("{} is not in the range [{}, {}]", *value, min_value, max_value));
            }
            return std::optional<std::uint32_t>(static_cast<std::uint32_t>(*value));
        }

        tl::expected<std::string, ParseError> hex_digest(const xmlNode* node,
                                                         const std::string& field,
                                                         ChecksumType type)
        {
            std::string value = to_lower(text(node));
            if (!is_hex(value))
                return invalid(field, fmt::format("'{}' is not a hex digest", value));

            const std::size_t expected_length = checksum_hex_length(type);
            if (expected_length != 0 && value.size() != expected_length)
            {
                return invalid(field,
                               fmt::format("{} digest must have {} hex digits, got {}",
                                           checksum_type_name(type),
                                           expected_length,
                                           value.size()));
            }
            return value;
        }

        tl::expected<Checksum, ParseError> parse_hash(const xmlNode* node)
        {
            auto tag = attribute(node, "type");
            if (!tag || tag->empty())
                return missing("hash@type");

            Checksum cs;
            cs.tag = to_lower(*tag);
            cs.type = checksum_type_from_name(cs.tag);
            if (cs.type == ChecksumType::kUNSUPPORTED)
            {
                spdlog::warn("Checksum algorithm '{}' is not supported, it cannot be verified",
                             cs.tag);
            }
            else if (!is_supported(cs.type))
            {
                spdlog::warn("Checksum algorithm '{}' is not available in this build", cs.tag);
            }

            auto value = hex_digest(node, "hash", cs.type);
            if (!value)
                return tl::unexpected(value.error());
            cs.checksum = std::move(value.value());
            return cs;
        }

        tl::expected<PieceHashes, ParseError> parse_pieces(const xmlNode* node)
        {
            PieceHashes pieces;

            auto tag = attribute(node, "type");
            if (!tag || tag->empty())
                return missing("pieces@type");
            pieces.tag = to_lower(*tag);
            pieces.type = checksum_type_from_name(pieces.tag);
            if (!is_supported(pieces.type))
            {
                spdlog::warn("Piece checksum algorithm '{}' is not supported, pieces cannot "
                             "be verified",
                             pieces.tag);
            }

            auto length = attribute(node, "length");
            if (!length)
                return missing("pieces@length");
            auto value = parse_uint(*length);
            if (!value)
                return invalid("pieces@length",
                               fmt::format("'{}' is not a decimal integer", *length));
            // a zero length is a layout problem reported by the plan
            pieces.length = *value;

            for (const xmlNode* child = node->children; child; child = child->next)
            {
                if (!is_metalink_element(child) || !has_name(child, "hash"))
                    continue;
                auto digest = hex_digest(child, "pieces/hash", pieces.type);
                if (!digest)
                    return tl::unexpected(digest.error());
                pieces.hashes.push_back(std::move(digest.value()));
            }
            return pieces;
        }

        tl::expected<std::optional<Resource>, ParseError> parse_url(const xmlNode* node,
                                                                    std::size_t declared_order)
        {
            Resource resource;
            resource.url = text(node);
            resource.declared_order = declared_order;

            auto priority = uint_attribute(node, "url", "priority", MIN_PRIORITY, MAX_PRIORITY);
            if (!priority)
                return tl::unexpected(priority.error());
            resource.priority = priority.value();

            auto max_connections
                = uint_attribute(node, "url", "maxconnections", 1, UINT32_MAX);
            if (!max_connections)
                return tl::unexpected(max_connections.error());
            resource.max_connections = max_connections.value();

            resource.location = attribute(node, "location");
            if (resource.location)
                resource.location = to_lower(*resource.location);

            if (!is_supported_url(resource.url))
            {
                spdlog::warn("Dropping unusable url '{}'", resource.url);
                return std::optional<Resource>();
            }
            resource.protocol = detect_protocol(resource.url);
            return std::optional<Resource>(std::move(resource));
        }

        tl::expected<MetaUrl, ParseError> parse_metaurl(const xmlNode* node)
        {
            MetaUrl metaurl;
            metaurl.url = text(node);
            if (metaurl.url.empty())
                return missing("metaurl");

            auto mediatype = attribute(node, "mediatype");
            if (!mediatype || mediatype->empty())
                return missing("metaurl@mediatype");
            metaurl.mediatype = *mediatype;

            auto priority
                = uint_attribute(node, "metaurl", "priority", MIN_PRIORITY, MAX_PRIORITY);
            if (!priority)
                return tl::unexpected(priority.error());
            metaurl.priority = priority.value();
            metaurl.name = attribute(node, "name");
            return metaurl;
        }

        tl::expected<FileEntry, ParseError> parse_file_element(const xmlNode* node)
        {
            FileEntry entry;

            auto name = attribute(node, "name");
            if (!name || name->empty())
                return missing("file@name");
            if (!is_safe_file_name(*name))
                return invalid("file@name",
                               fmt::format("'{}' must be a relative path without '..'", *name));
            entry.name = *name;

            std::size_t url_index = 0;
            for (const xmlNode* child = node->children; child; child = child->next)
            {
                if (!is_metalink_element(child))
                    continue;

                if (has_name(child, "size"))
                {
                    const std::string raw = text(child);
                    auto size = parse_uint(raw);
                    if (!size)
                        return invalid("size", fmt::format("'{}' is not a decimal integer", raw));
                    entry.size = size;
                }
                else if (has_name(child, "hash"))
                {
                    auto cs = parse_hash(child);
                    if (!cs)
                        return tl::unexpected(cs.error());
                    entry.checksums.push_back(std::move(cs.value()));
                }
                else if (has_name(child, "pieces"))
                {
                    auto pieces = parse_pieces(child);
                    if (!pieces)
                        return tl::unexpected(pieces.error());
                    entry.pieces = std::move(pieces.value());
                }
                else if (has_name(child, "url"))
                {
                    auto resource = parse_url(child, url_index++);
                    if (!resource)
                        return tl::unexpected(resource.error());
                    if (resource.value())
                        entry.resources.push_back(std::move(*resource.value()));
                }
                else if (has_name(child, "metaurl"))
                {
                    auto metaurl = parse_metaurl(child);
                    if (!metaurl)
                        return tl::unexpected(metaurl.error());
                    entry.metaurls.push_back(std::move(metaurl.value()));
                }
                else if (has_name(child, "publisher"))
                {
                    auto publisher_name = attribute(child, "name");
                    if (!publisher_name)
                        return missing("publisher@name");
                    entry.publisher = Publisher{ *publisher_name, attribute(child, "url") };
                }
                else if (has_name(child, "signature"))
                {
                    auto mediatype = attribute(child, "mediatype");
                    if (!mediatype)
                        return missing("signature@mediatype");
                    entry.signature = Signature{ *mediatype, text(child) };
                }
                else if (has_name(child, "identity"))
                    entry.identity = text(child);
                else if (has_name(child, "version"))
                    entry.version = text(child);
                else if (has_name(child, "description"))
                    entry.description = text(child);
                else if (has_name(child, "copyright"))
                    entry.copyright = text(child);
                else if (has_name(child, "logo"))
                    entry.logo = text(child);
                else if (has_name(child, "language"))
                    entry.languages.push_back(text(child));
                else if (has_name(child, "os"))
                    entry.os.push_back(text(child));
                else
                    spdlog::debug("Ignoring element <{}> of file {}",
                                  reinterpret_cast<const char*>(child->name),
                                  entry.name);
            }

            if (entry.resources.empty())
            {
                spdlog::warn("File {} has no usable url", entry.name);
            }
            return entry;
        }

        tl::expected<Metalink, ParseError> parse_document(const xmlDoc* doc)
        {
            const xmlNode* root = xmlDocGetRootElement(doc);
            if (!root)
                return fail(ParseErrorKind::kMALFORMED_XML, "", "document has no root element");

            if (!is_metalink_element(root))
            {
                std::string ns = root->ns ? reinterpret_cast<const char*>(root->ns->href)
                                          : std::string("<none>");
                return fail(ParseErrorKind::kUNKNOWN_NAMESPACE,
                            "metalink",
                            fmt::format("root element <{}> has namespace {}, expected {}",
                                        reinterpret_cast<const char*>(root->name),
                                        ns,
                                        METALINK_NAMESPACE));
            }
            if (!has_name(root, "metalink"))
                return missing("metalink");

            Metalink metalink;
            for (const xmlNode* child = root->children; child; child = child->next)
            {
                if (!is_metalink_element(child))
                    continue;

                if (has_name(child, "file"))
                {
                    auto entry = parse_file_element(child);
                    if (!entry)
                        return tl::unexpected(entry.error());
                    metalink.files.push_back(std::move(entry.value()));
                }
                else if (has_name(child, "generator"))
                {
                    metalink.generator = text(child);
                }
                else if (has_name(child, "origin"))
                {
                    Origin origin{ text(child), false };
                    if (auto dynamic = attribute(child, "dynamic"))
                    {
                        if (*dynamic == "true")
                            origin.dynamic = true;
                        else if (*dynamic != "false")
                            return invalid("origin@dynamic",
                                           fmt::format("'{}' is not a boolean", *dynamic));
                    }
                    metalink.origin = std::move(origin);
                }
                else if (has_name(child, "published") || has_name(child, "updated"))
                {
                    const std::string field = reinterpret_cast<const char*>(child->name);
                    std::string value = text(child);
                    if (!is_rfc3339_datetime(value))
                        return invalid(field,
                                       fmt::format("'{}' is not an RFC 3339 date-time", value));
                    if (field == "published")
                        metalink.published = std::move(value);
                    else
                        metalink.updated = std::move(value);
                }
            }

            if (metalink.files.empty())
                return missing("file");
            return metalink;
        }
    }

    tl::expected<Metalink, ParseError> parse_metalink(std::string_view xml)
    {
        if (xml.size() > static_cast<std::size_t>(INT_MAX))
            return fail(ParseErrorKind::kMALFORMED_XML, "", "document too large");

        // no entity substitution, no DTD loading, no network
        const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
        xml_doc_ptr doc(
            xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "metalink.meta4", nullptr,
                          options),
            &xmlFreeDoc);

        if (!doc)
        {
            std::string reason = "could not parse document";
            if (const xmlError* err = xmlGetLastError(); err && err->message)
            {
                reason = fmt::format("line {}: {}", err->line, strip(err->message));
            }
            return fail(ParseErrorKind::kMALFORMED_XML, "", reason);
        }
        return parse_document(doc.get());
    }

    tl::expected<Metalink, ParseError> parse_metalink_file(const fs::path& path)
    {
        std::ifstream infile(path, std::ios::binary);
        if (!infile)
        {
            return fail(ParseErrorKind::kMALFORMED_XML,
                        "",
                        fmt::format("could not read {}", path.string()));
        }
        std::stringstream buffer;
        buffer << infile.rdbuf();
        const std::string content = buffer.str();
        return parse_metalink(content);
    }

    bool is_safe_file_name(std::string_view name)
    {
        if (name.empty() || name.front() == '/' || name.front() == '\\')
            return false;
        // drive letter
        if (name.size() > 1 && name[1] == ':')
            return false;

        std::string normalized(name);
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        for (const auto& segment : split(normalized, "/"))
        {
            if (segment == "..")
                return false;
        }
        return !ends_with(normalized, "/");
    }

    bool is_rfc3339_datetime(std::string_view value)
    {
        static const std::regex pattern(
            R"(\d{4}-\d{2}-\d{2}[Tt ]\d{2}:\d{2}:\d{2}(\.\d+)?([Zz]|[+-]\d{2}:\d{2}))");
        return std::regex_match(value.begin(), value.end(), pattern);
    }
}
