#include <mcpguard/filter.hpp>
#include <mcpguard/logger.hpp>

#include <utility>

namespace mcpguard
{

ResponseFilter::ResponseFilter(const Policy& policy, Logger* logger)
    : policy_(policy), logger_(logger)
{
}

const char* ResponseFilter::collection_key(EntityType type)
{
    switch (type)
    {
    case EntityType::Tool:
        return "tools";
    case EntityType::Prompt:
        return "prompts";
    case EntityType::Resource:
        return "resources";
    }
    return "tools";
}

size_t ResponseFilter::apply(EntityType type, json& response) const
{
    if (!response.is_object())
        return 0;

    auto result = response.find("result");
    if (result == response.end() || !result->is_object())
        return 0;

    auto entities = result->find(collection_key(type));
    if (entities == result->end() || !entities->is_array())
        return 0;

    const char* kind = entity_type_name(type);
    json kept = json::array();
    size_t removed = 0;

    for (auto& entity : *entities)
    {
        // find() on a non-object yields end()
        auto name = entity.find("name");
        if (name == entity.end() || !name->is_string())
        {
            ++removed;
            if (logger_)
                logger_->log_json(std::string("Filtered ") + kind + " without a name", entity);
            continue;
        }

        const std::string entity_name = name->get<std::string>();
        if (policy_.is_allowed(type, entity_name))
        {
            kept.push_back(std::move(entity));
        }
        else
        {
            ++removed;
            if (logger_)
                logger_->log(std::string("Filtered ") + kind + ": " + entity_name);
        }
    }

    *entities = std::move(kept);
    return removed;
}

} // namespace mcpguard
