#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace sqlaudit {

/**
 * @brief Who issued the statement, as far as the application knows
 */
struct ActorContext {
    std::optional<std::string> actor_id;
    std::optional<std::string> actor_name;
    std::optional<std::string> network_address;
    std::optional<std::string> agent_string;
    PropertyMap custom_properties;
};

/**
 * @brief Supplies the actor of the statement being audited
 *
 * Called on the executing thread, once per audited statement.
 * std::nullopt means "no actor known"; the record is still produced.
 */
class IActorContextProvider {
public:
    virtual ~IActorContextProvider() = default;

    [[nodiscard]] virtual std::optional<ActorContext> current_context() const = 0;
};

/**
 * @brief Fixed actor, e.g. a batch job or the command-line tool
 *
 * Defaults to the "system" actor.
 */
class StaticActorContextProvider : public IActorContextProvider {
public:
    static constexpr const char* kDefaultActorId = "system";
    static constexpr const char* kDefaultActorName = "System User";

    StaticActorContextProvider() {
        context_.actor_id = kDefaultActorId;
        context_.actor_name = kDefaultActorName;
    }

    explicit StaticActorContextProvider(ActorContext context)
        : context_(std::move(context)) {}

    std::optional<ActorContext> current_context() const override { return context_; }

private:
    ActorContext context_;
};

} // namespace sqlaudit
