#pragma once
/**
 * @file lifecycle.hpp
 * @brief Ordered startup and shutdown of process-wide modules.
 *
 * Modules (the Logger, the known-device cache, ...) describe themselves with a
 * `ModuleDef` and are started in dependency order by `LifecycleManager::initialize()`
 * and shut down in reverse order by `finalize()`. Applications normally own the
 * lifecycle through a `LifecycleGuard` in `main()`:
 *
 * @code
 *   int main() {
 *       plushlink::utils::LifecycleGuard lifecycle(plushlink::utils::MakeModDefList(
 *           plushlink::utils::Logger::GetLifecycleModule()));
 *       ...
 *   } // modules are finalized here
 * @endcode
 */
#include "plushlink_utils_export.h"
#include "utils/module_def.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::utils
{

class LifecycleManagerImpl;

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

/**
 * @class LifecycleManager
 * @brief Starts registered modules in topological order and stops them in reverse.
 *
 * `instance()` is the process-wide manager. Independent managers can be constructed
 * directly (tests do this to exercise ordering without touching the global one).
 */
class PLUSHLINK_UTILS_EXPORT LifecycleManager
{
  public:
    LifecycleManager();
    ~LifecycleManager();
    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Only valid before initialize().
     * @throws std::logic_error if called after initialize().
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module. Idempotent.
     * @throws std::runtime_error on duplicate names, undefined dependencies, cycles, or a
     *         startup callback that throws. Modules already started are shut down first.
     */
    void initialize(std::source_location loc = std::source_location::current());

    /**
     * @brief Shuts down started modules in reverse startup order. Idempotent.
     */
    void finalize(std::source_location loc = std::source_location::current());

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    /// Names of started modules, in the order they were started.
    [[nodiscard]] std::vector<std::string> startup_order() const;

  private:
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the global lifecycle: registers and initializes on construction,
 *        finalizes on destruction.
 *
 * Only the first guard in a process owns the lifecycle; later guards print a warning
 * and do nothing.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &mod : modules)
            {
                RegisterModule(std::move(mod));
            }
            InitializeApp(loc);
        }
        else
        {
            fmt::print(stderr,
                       "[PLL_LifeCycle] WARNING: LifecycleGuard constructed but an owner already "
                       "exists. ({}:{})\n",
                       loc.file_name(), loc.line());
        }
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            FinalizeApp(m_loc);
        }
    }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace plushlink::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
