#ifndef CONFIG_OPTIONS_H
#define CONFIG_OPTIONS_H

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "kernel/Kernel.h"

namespace YAML {
class Node;
class Emitter;
}

// Text names for every KernelConfig field (snake_case, e.g. "forensic_capacity").
// The flat key is used by the CLI (--key=value, "set key value"); config files
// are YAML with the same names grouped by section:
//
//   simulation:
//     seed: 42
//     n_days: 365
//   model:
//     n_agents: 500
//     forensic_capacity: 0.55
//     rewiring:
//       enabled: true
struct ConfigOption {
    const char* key;       // flat name
    const char* section;   // "simulation", "model" or "model.rewiring"
    const char* field;     // name inside the section
    const char* help;
    std::function<void(KernelConfig&, const std::string&)> set;
    std::function<std::string(const KernelConfig&)> get;
    std::function<void(KernelConfig&, const YAML::Node&)> load;
    std::function<void(YAML::Emitter&, const KernelConfig&)> emit;
};

const std::vector<ConfigOption>& configOptions();

// Throws std::invalid_argument for unknown keys or malformed values.
// Range checks are left to validateConfig().
void applyConfigOption(KernelConfig& cfg, const std::string& key, const std::string& value);
std::string configValue(const KernelConfig& cfg, const std::string& key);

// "--key=value" -> applied, returns true. Anything else returns false.
bool applyOptionArgument(KernelConfig& cfg, const std::string& arg);

// YAML documents on top of `base`. Unknown sections/keys and bad values throw
// std::invalid_argument (with the document line); a missing file throws
// std::runtime_error.
KernelConfig readConfig(std::istream& in, const KernelConfig& base = KernelConfig{});
KernelConfig readConfigFile(const std::string& path, const KernelConfig& base = KernelConfig{});

// Writes every key in readConfig() format.
void writeConfig(const KernelConfig& cfg, std::ostream& out);

#endif
