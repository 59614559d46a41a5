/**
 * @file registry.cpp
 * @brief EnvironmentRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "environment/registry.hpp"

#include <algorithm>

namespace exec_engine {

EnvironmentRegistry::EnvironmentRegistry()
    : catalogue_(std::make_shared<const Catalogue>()) {}

EnvironmentRegistry::EnvironmentRegistry(const std::vector<ExecutionEnvironment>& environments)
    : EnvironmentRegistry() {
    if (auto result = replace_all(environments); !result) {
        throw std::invalid_argument(result.error().message);
    }
}

Result<EnvironmentHandle, Rejection> EnvironmentRegistry::resolve(const EnvironmentId& id) const {
    auto catalogue = catalogue_.load();
    auto it = catalogue->find(id);
    if (it == catalogue->end()) {
        return Rejection{RejectReason::UnknownEnvironment, "no environment '" + id + "'"};
    }
    const auto& env = it->second;
    if (env->status == EnvironmentStatus::Maintenance
        || env->status == EnvironmentStatus::Disabled) {
        return Rejection{RejectReason::EnvironmentUnavailable,
                         "environment '" + id + "' is " + std::string{to_string(env->status)}};
    }
    return env;
}

Result<void> EnvironmentRegistry::replace_all(const std::vector<ExecutionEnvironment>& environments) {
    auto next = std::make_shared<Catalogue>();
    for (const auto& env : environments) {
        if (auto valid = validate_environment(env); !valid) {
            return valid.error();
        }
        if (next->contains(env.id)) {
            return Error{"duplicate environment id '" + env.id + "'"};
        }
        next->emplace(env.id, std::make_shared<const ExecutionEnvironment>(env));
    }

    std::lock_guard lock(write_mutex_);
    catalogue_.store(std::move(next));
    return {};
}

Result<void> EnvironmentRegistry::register_environment(ExecutionEnvironment env) {
    if (auto valid = validate_environment(env); !valid) {
        return valid.error();
    }

    std::lock_guard lock(write_mutex_);
    auto current = catalogue_.load();
    if (current->contains(env.id)) {
        return Error{"environment '" + env.id + "' already registered; publish a new id instead"};
    }
    auto next = std::make_shared<Catalogue>(*current);
    auto id = env.id;
    next->emplace(std::move(id), std::make_shared<const ExecutionEnvironment>(std::move(env)));
    catalogue_.store(std::move(next));
    return {};
}

Result<void> EnvironmentRegistry::retire(const EnvironmentId& id) {
    std::lock_guard lock(write_mutex_);
    auto current = catalogue_.load();
    if (!current->contains(id)) {
        return Error{"no environment '" + id + "' to retire"};
    }
    auto next = std::make_shared<Catalogue>(*current);
    next->erase(id);
    catalogue_.store(std::move(next));
    return {};
}

std::vector<EnvironmentHandle> EnvironmentRegistry::list() const {
    auto catalogue = catalogue_.load();
    std::vector<EnvironmentHandle> out;
    out.reserve(catalogue->size());
    for (const auto& [id, env] : *catalogue) {
        out.push_back(env);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a->id < b->id; });
    return out;
}

size_t EnvironmentRegistry::size() const {
    return catalogue_.load()->size();
}

}  // namespace exec_engine
