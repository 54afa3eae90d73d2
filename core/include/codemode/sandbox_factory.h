#pragma once

#include "codemode/process_sandbox.h"
#include "codemode/sandbox.h"
#include "codemode/sandbox_pool.h"
#include "codemode/types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codemode {

struct SandboxModeInfo {
    std::string name;
    std::string isolation;
    std::string performance;
    std::string security;
    std::string requirements;
};

// Base configuration behind the create_* functions. Loaded from the
// CODEMODE_* environment on first use unless set explicitly.
struct FactoryDefaults {
    SandboxOptions sandbox;
    PoolOptions pool;
    WorkerConfig worker;
    IsolationMode fallback_mode{IsolationMode::IN_PROCESS};
};

FactoryDefaults factory_defaults();
void set_factory_defaults(const FactoryDefaults& d);

// Process-wide default mode. Precedence when creating: explicit argument,
// then this setting, then FactoryDefaults::fallback_mode.
void set_default_sandbox_mode(IsolationMode mode);
IsolationMode default_sandbox_mode();
void reset_default_sandbox_mode();

std::vector<IsolationMode> available_sandbox_modes();
SandboxModeInfo sandbox_mode_info(IsolationMode mode);

// Direct construction with fully resolved options; throws std::runtime_error
// when the backend cannot be started.
std::unique_ptr<Sandbox> make_sandbox(IsolationMode mode, const SandboxOptions& options,
                                      const WorkerConfig& worker);
SandboxCreator sandbox_creator(IsolationMode mode, const SandboxOptions& options,
                               const WorkerConfig& worker);

// Every call returns an independent instance.
std::unique_ptr<Sandbox> create_sandbox(std::optional<IsolationMode> mode = std::nullopt,
                                        const SandboxOverrides& overrides = {});
std::unique_ptr<SandboxPool> create_sandbox_pool(std::optional<IsolationMode> mode = std::nullopt,
                                                 std::optional<PoolOptions> pool = std::nullopt,
                                                 const SandboxOverrides& overrides = {});

} // namespace codemode
