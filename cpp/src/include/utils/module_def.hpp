#pragma once
/**
 * @file module_def.hpp
 * @brief Module definition for LifecycleManager registration.
 */
#include "plushlink_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback. `arg` is nullptr when no argument was supplied.
 *
 * A plain function pointer keeps the module table trivially copyable across shared
 * library boundaries.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module: a name, the modules it depends on, and its
 *        startup/shutdown callbacks.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 */
class PLUSHLINK_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// The named module is started before this one and shut down after it.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param shutdown_func Called on finalize.
     * @param timeout_ms    finalize() stops waiting for this callback after the timeout
     *                      and moves on to the next module.
     */
    void set_shutdown(LifecycleCallback shutdown_func, unsigned int timeout_ms);

    [[nodiscard]] const std::string &name() const noexcept;

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace plushlink::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
