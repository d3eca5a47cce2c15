#include <pumpevents/core/events/event_catalog.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace PumpEvents {

namespace {

template <typename T>
T requireScalar(const YAML::Node& node, const char* key, const std::string& context) {
    const YAML::Node value = node[key];
    if (!value)
        throw std::runtime_error(context + ": missing required key '" + key + "'");
    try {
        return value.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error(context + ": invalid value for '" + key + "'");
    }
}

FieldSpec parseField(const YAML::Node& node, const std::string& eventContext) {
    if (!node.IsMap())
        throw std::runtime_error(eventContext + ": field entries must be maps");

    FieldSpec f;
    f.name = requireScalar<std::string>(node, "name", eventContext);
    const std::string context = eventContext + "." + f.name;

    // Read as unsigned int first: uint8_t would be parsed as a character
    unsigned offset = requireScalar<unsigned>(node, "offset", context);
    unsigned width = requireScalar<unsigned>(node, "width", context);
    if (offset > 255 || width > 255)
        throw std::runtime_error(context + ": offset/width out of range");
    f.offset = static_cast<uint8_t>(offset);
    f.width = static_cast<uint8_t>(width);

    if (node["encoding"]) {
        std::string enc = requireScalar<std::string>(node, "encoding", context);
        if (!parseFieldEncoding(enc, f.encoding))
            throw std::runtime_error(context + ": unknown encoding '" + enc + "'");
    }
    if (node["scale"])
        f.scale = requireScalar<double>(node, "scale", context);

    return f;
}

PayloadSchema parseEvent(const YAML::Node& node, size_t index) {
    const std::string indexContext = "events[" + std::to_string(index) + "]";
    if (!node.IsMap())
        throw std::runtime_error(indexContext + ": entry must be a map");

    PayloadSchema schema;
    unsigned id = requireScalar<unsigned>(node, "id", indexContext);
    if (id > 0xFFFF)
        throw std::runtime_error(indexContext + ": id out of range");
    schema.type_id = static_cast<uint16_t>(id);
    schema.name = requireScalar<std::string>(node, "name", indexContext);

    const std::string context = schema.name + "(" + std::to_string(id) + ")";
    if (node["kind"]) {
        std::string kind = requireScalar<std::string>(node, "kind", context);
        if (!parseRecordKind(kind, schema.kind))
            throw std::runtime_error(context + ": unknown kind '" + kind + "'");
    }

    const YAML::Node fields = node["fields"];
    if (fields) {
        if (!fields.IsSequence())
            throw std::runtime_error(context + ": 'fields' must be a list");
        for (const auto& field : fields)
            schema.fields.push_back(parseField(field, context));
    }
    return schema;
}

std::vector<PayloadSchema> parseCatalog(const YAML::Node& root) {
    const YAML::Node events = root["events"];
    if (!events || !events.IsSequence())
        throw std::runtime_error("Event catalog must contain an 'events' list");

    std::vector<PayloadSchema> schemas;
    schemas.reserve(events.size());
    for (size_t i = 0; i < events.size(); ++i)
        schemas.push_back(parseEvent(events[i], i));
    return schemas;
}

} // anonymous namespace

std::vector<PayloadSchema> EventCatalogLoader::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open event catalog: " + path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot parse event catalog " + path + ": " + e.what());
    }

    auto schemas = parseCatalog(root);
    spdlog::info("[EventCatalog] Loaded {} event layouts from {}", schemas.size(), path);
    return schemas;
}

std::vector<PayloadSchema> EventCatalogLoader::loadString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Cannot parse event catalog: ") + e.what());
    }
    return parseCatalog(root);
}

} // namespace PumpEvents
