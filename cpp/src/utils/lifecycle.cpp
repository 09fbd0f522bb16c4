/**
 * @file lifecycle.cpp
 * @brief ModuleDef and LifecycleManager implementation.
 *
 * initialize() builds a dependency graph from the registered modules, orders it with
 * Kahn's algorithm and runs each startup callback. finalize() walks the same order
 * backwards. Each shutdown callback runs on its own thread so a hung module cannot
 * block the rest of the shutdown beyond its configured timeout.
 */
#include "utils/lifecycle.hpp"
#include "utils/format_tools.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace plushlink::utils
{

// ============================================================================
// ModuleDef
// ============================================================================

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup = nullptr;
    std::string startup_arg;
    bool has_startup_arg = false;
    LifecycleCallback shutdown = nullptr;
    unsigned int shutdown_timeout_ms = 1000;
};

namespace
{
void check_name_length(std::string_view name)
{
    if (name.size() > ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(
            fmt::format("Module name exceeds {} characters: '{:.32}...'",
                        ModuleDef::MAX_MODULE_NAME_LEN, name));
    }
}
} // namespace

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.empty())
    {
        throw std::invalid_argument("Module name must not be empty");
    }
    check_name_length(name);
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    check_name_length(dependency_name);
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup = startup_func;
    pImpl->has_startup_arg = false;
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    pImpl->startup = startup_func;
    pImpl->startup_arg = std::string(arg);
    pImpl->has_startup_arg = true;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, unsigned int timeout_ms)
{
    pImpl->shutdown = shutdown_func;
    pImpl->shutdown_timeout_ms = timeout_ms;
}

const std::string &ModuleDef::name() const noexcept
{
    return pImpl->name;
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    struct Node
    {
        ModuleDefImpl def;
        std::vector<Node *> dependents;
        bool started = false;
    };

    void register_module(ModuleDefImpl &&def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::vector<Node *> topological_sort();
    void shutdown_with_timeout(Node &node);

    mutable std::mutex m_mutex;
    std::vector<ModuleDefImpl> m_registered;
    std::map<std::string, Node> m_graph;
    std::vector<Node *> m_startup_order;
    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_finalized{false};
};

void LifecycleManagerImpl::register_module(ModuleDefImpl &&def)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized.load(std::memory_order_acquire))
    {
        throw std::logic_error("register_module('" + def.name +
                               "') called after the lifecycle was initialized");
    }
    m_registered.push_back(std::move(def));
}

/**
 * @brief Kahn's algorithm over the registered graph.
 * @throws std::runtime_error If a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::Node *> LifecycleManagerImpl::topological_sort()
{
    std::map<Node *, size_t> in_degrees;
    for (auto &[name, node] : m_graph)
    {
        in_degrees[&node] += 0;
        for (auto *dep : node.dependents)
        {
            in_degrees[dep]++;
        }
    }
    std::vector<Node *> queue;
    for (auto &[node, degree] : in_degrees)
    {
        if (degree == 0)
        {
            queue.push_back(node);
        }
    }
    std::vector<Node *> sorted;
    size_t head = 0;
    while (head < queue.size())
    {
        Node *current = queue[head++];
        sorted.push_back(current);
        for (Node *dependent : current->dependents)
        {
            if (--in_degrees[dependent] == 0)
            {
                queue.push_back(dependent);
            }
        }
    }
    if (sorted.size() != m_graph.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted;
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    for (auto &def : m_registered)
    {
        if (m_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        const std::string name = def.name;
        m_graph[name].def = std::move(def);
    }
    m_registered.clear();
    for (auto &[name, node] : m_graph)
    {
        for (const auto &dep_name : node.def.dependencies)
        {
            auto iter = m_graph.find(dep_name);
            if (iter == m_graph.end())
            {
                throw std::runtime_error("Undefined dependency '" + dep_name + "' of module '" +
                                         name + "'");
            }
            iter->second.dependents.push_back(&node);
        }
    }
    auto order = topological_sort();

    for (auto *node : order)
    {
        try
        {
            if (node->def.startup)
            {
                node->def.startup(node->def.has_startup_arg ? node->def.startup_arg.c_str()
                                                            : nullptr);
            }
            node->started = true;
            m_startup_order.push_back(node);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr,
                       "[PLL_LifeCycle] Module '{}' failed to start ({}), initialize() called from "
                       "{} ({}:{}). Shutting down started modules.\n",
                       node->def.name, e.what(), loc.function_name(),
                       format_tools::filename_only(loc.file_name()), loc.line());
            for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
            {
                shutdown_with_timeout(**it);
            }
            m_startup_order.clear();
            m_finalized.store(true, std::memory_order_release);
            throw std::runtime_error("Module '" + node->def.name + "' failed to start: " +
                                     e.what());
        }
    }
}

void LifecycleManagerImpl::shutdown_with_timeout(Node &node)
{
    if (!node.started || node.def.shutdown == nullptr)
    {
        node.started = false;
        return;
    }
    node.started = false;
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    LifecycleCallback callback = node.def.shutdown;
    std::string name = node.def.name;
    std::thread worker(
        [callback, done, name]()
        {
            try
            {
                callback(nullptr);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[PLL_LifeCycle] Module '{}' shutdown threw: {}\n", name,
                           e.what());
            }
            done->set_value();
        });
    if (future.wait_for(std::chrono::milliseconds(node.def.shutdown_timeout_ms)) ==
        std::future_status::ready)
    {
        worker.join();
    }
    else
    {
        fmt::print(stderr,
                   "[PLL_LifeCycle] Module '{}' did not shut down within {} ms; continuing.\n",
                   name, node.def.shutdown_timeout_ms);
        worker.detach();
    }
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized.load(std::memory_order_acquire) ||
        m_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    (void)loc;
    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        shutdown_with_timeout(**it);
    }
}

// ============================================================================
// LifecycleManager public API
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    pImpl->register_module(std::move(*module_def.pImpl));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->m_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->m_finalized.load(std::memory_order_acquire);
}

std::vector<std::string> LifecycleManager::startup_order() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    std::vector<std::string> names;
    for (const auto *node : pImpl->m_startup_order)
    {
        names.push_back(node->def.name);
    }
    return names;
}

} // namespace plushlink::utils
