/**
 * @file TargetResolver.h
 * @brief Expand a target id into the ordered set of physical device ids
 *
 * A device id maps to itself. A group entity reports its members in an
 * "entity_id" attribute (comma separated) and maps to those members,
 * de-duplicated, first occurrence wins. A speaker's "group_members"
 * attribute does not expand anything.
 */

#ifndef REPLAY2PLAYER_TARGET_RESOLVER_H
#define REPLAY2PLAYER_TARGET_RESOLVER_H

#include "CommandBus.h"

#include <string>
#include <vector>

class TargetResolver {
public:
    explicit TargetResolver(CommandBus& bus) : m_bus(bus) {}

    /**
     * @brief Resolve targetId; empty result if it cannot be resolved
     */
    std::vector<std::string> expand(const std::string& targetId);

    static std::vector<std::string> splitMembers(const std::string& value);

private:
    CommandBus& m_bus;
};

#endif // REPLAY2PLAYER_TARGET_RESOLVER_H
