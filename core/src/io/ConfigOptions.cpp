#include "io/ConfigOptions.h"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lineOf(const YAML::Mark& mark) {
    return "config line " + std::to_string(mark.line + 1);
}

std::invalid_argument badValue(const std::string& key, const std::string& value, const char* expected) {
    return std::invalid_argument("bad value for " + key + ": '" + value + "' (expected " + expected + ")");
}

std::invalid_argument badNode(const char* key, const YAML::Node& node, const char* expected) {
    const std::string text = node.IsScalar() ? node.Scalar() : std::string("<not a scalar>");
    return std::invalid_argument(lineOf(node.Mark()) + ": " + badValue(key, text, expected).what());
}

// ---------- command-line text ----------

double parseDouble(const std::string& key, const std::string& text) {
    const std::string v = trim(text);
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::exception&) {
        throw badValue(key, text, "a number");
    }
    if (used != v.size()) throw badValue(key, text, "a number");
    return out;
}

std::uint64_t parseUnsigned(const std::string& key, const std::string& text, std::uint64_t max) {
    const std::string v = trim(text);
    if (v.empty() || !std::isdigit(static_cast<unsigned char>(v[0]))) {
        throw badValue(key, text, "a non-negative integer");
    }
    std::size_t used = 0;
    unsigned long long out = 0;
    try {
        out = std::stoull(v, &used);
    } catch (const std::exception&) {
        throw badValue(key, text, "a non-negative integer");
    }
    if (used != v.size() || out > max) throw badValue(key, text, "a non-negative integer in range");
    return static_cast<std::uint64_t>(out);
}

bool parseBool(const std::string& key, const std::string& text) {
    const std::string v = trim(text);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw badValue(key, text, "true/false");
}

std::string formatDouble(double v) {
    std::ostringstream os;
    os << std::setprecision(12) << v;
    return os.str();
}

// ---------- YAML scalars ----------

double loadDouble(const char* key, const YAML::Node& node) {
    if (!node.IsScalar()) throw badNode(key, node, "a number");
    try {
        return node.as<double>();
    } catch (const YAML::BadConversion&) {
        throw badNode(key, node, "a number");
    }
}

std::uint64_t loadUnsigned(const char* key, const YAML::Node& node, std::uint64_t max) {
    // yaml-cpp wraps "-5" into a huge unsigned on some versions
    if (!node.IsScalar() || node.Scalar().empty() ||
        !std::isdigit(static_cast<unsigned char>(node.Scalar()[0]))) {
        throw badNode(key, node, "a non-negative integer");
    }
    std::uint64_t out = 0;
    try {
        out = node.as<std::uint64_t>();
    } catch (const YAML::BadConversion&) {
        throw badNode(key, node, "a non-negative integer");
    }
    if (out > max) throw badNode(key, node, "a non-negative integer in range");
    return out;
}

bool loadBool(const char* key, const YAML::Node& node) {
    if (!node.IsScalar()) throw badNode(key, node, "true/false");
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        throw badNode(key, node, "true/false");
    }
}

// ---------- option table ----------

ConfigOption doubleOption(const char* key, const char* section, const char* field, const char* help,
                          double KernelConfig::*member) {
    return ConfigOption{
        key, section, field, help,
        [key, member](KernelConfig& cfg, const std::string& v) { cfg.*member = parseDouble(key, v); },
        [member](const KernelConfig& cfg) { return formatDouble(cfg.*member); },
        [key, member](KernelConfig& cfg, const YAML::Node& n) { cfg.*member = loadDouble(key, n); },
        [field, member](YAML::Emitter& out, const KernelConfig& cfg) {
            out << YAML::Key << field << YAML::Value << cfg.*member;
        }};
}

ConfigOption countOption(const char* key, const char* section, const char* field, const char* help,
                         std::uint32_t KernelConfig::*member) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint32_t>::max();
    return ConfigOption{
        key, section, field, help,
        [key, member](KernelConfig& cfg, const std::string& v) {
            cfg.*member = static_cast<std::uint32_t>(parseUnsigned(key, v, kMax));
        },
        [member](const KernelConfig& cfg) { return std::to_string(cfg.*member); },
        [key, member](KernelConfig& cfg, const YAML::Node& n) {
            cfg.*member = static_cast<std::uint32_t>(loadUnsigned(key, n, kMax));
        },
        [field, member](YAML::Emitter& out, const KernelConfig& cfg) {
            out << YAML::Key << field << YAML::Value << cfg.*member;
        }};
}

ConfigOption flagOption(const char* key, const char* section, const char* field, const char* help,
                        bool KernelConfig::*member) {
    return ConfigOption{
        key, section, field, help,
        [key, member](KernelConfig& cfg, const std::string& v) { cfg.*member = parseBool(key, v); },
        [member](const KernelConfig& cfg) { return std::string(cfg.*member ? "true" : "false"); },
        [key, member](KernelConfig& cfg, const YAML::Node& n) { cfg.*member = loadBool(key, n); },
        [field, member](YAML::Emitter& out, const KernelConfig& cfg) {
            out << YAML::Key << field << YAML::Value << cfg.*member;
        }};
}

std::vector<ConfigOption> buildOptions() {
    const char* sim = "simulation";
    const char* model = "model";
    const char* rewiring = "model.rewiring";

    std::vector<ConfigOption> opts;
    opts.push_back(ConfigOption{
        "seed", sim, "seed", "random seed",
        [](KernelConfig& cfg, const std::string& v) {
            cfg.seed = parseUnsigned("seed", v, std::numeric_limits<std::uint64_t>::max());
        },
        [](const KernelConfig& cfg) { return std::to_string(cfg.seed); },
        [](KernelConfig& cfg, const YAML::Node& n) {
            cfg.seed = loadUnsigned("seed", n, std::numeric_limits<std::uint64_t>::max());
        },
        [](YAML::Emitter& out, const KernelConfig& cfg) {
            out << YAML::Key << "seed" << YAML::Value << cfg.seed;
        }});
    opts.push_back(countOption("n_days", sim, "n_days", "horizon in days for run", &KernelConfig::horizonDays));

    opts.push_back(countOption("n_agents", model, "n_agents", "population size", &KernelConfig::population));
    opts.push_back(countOption("sf_m", model, "sf_m", "Barabasi-Albert attachment count m", &KernelConfig::attachment));

    opts.push_back(doubleOption("initial_criminal_share", model, "initial_criminal_share",
                                "initial CRIMINAL share", &KernelConfig::initialCriminalShare));
    opts.push_back(doubleOption("initial_at_risk_share", model, "initial_at_risk_share",
                                "initial AT_RISK share", &KernelConfig::initialAtRiskShare));

    opts.push_back(doubleOption("peer_influence_weight", model, "peer_influence_weight",
                                "weight of criminal-neighbor share", &KernelConfig::peerInfluenceWeight));
    opts.push_back(doubleOption("risk_threshold", model, "risk_threshold",
                                "LAWFUL -> AT_RISK propensity threshold", &KernelConfig::riskThreshold));
    opts.push_back(doubleOption("at_risk_decay_prob", model, "at_risk_decay_prob",
                                "AT_RISK -> LAWFUL daily probability", &KernelConfig::atRiskDecayProb));
    opts.push_back(doubleOption("crime_base_rate", model, "crime_base_rate",
                                "baseline daily offending probability", &KernelConfig::crimeBaseRate));

    opts.push_back(doubleOption("coercive_capacity", model, "coercive_capacity",
                                "arrest attempts per capita per day", &KernelConfig::coerciveCapacity));
    opts.push_back(doubleOption("forensic_capacity", model, "forensic_capacity",
                                "targeting accuracy / evidence quality", &KernelConfig::forensicCapacity));
    opts.push_back(doubleOption("detention_days_mean", model, "detention_days_mean",
                                "mean pre-trial detention (days)", &KernelConfig::detentionDaysMean));
    opts.push_back(doubleOption("conviction_base_prob", model, "conviction_base_prob",
                                "base conviction probability", &KernelConfig::convictionBaseProb));
    opts.push_back(doubleOption("prison_sentence_days_mean", model, "prison_sentence_days_mean",
                                "mean prison sentence (days)", &KernelConfig::prisonSentenceDaysMean));

    opts.push_back(doubleOption("detention_stigma_increment", model, "detention_stigma_increment",
                                "stigma added on arrest", &KernelConfig::detentionStigmaIncrement));
    opts.push_back(doubleOption("detention_criminal_capital_increment", model, "detention_criminal_capital_increment",
                                "capital added on release without conviction", &KernelConfig::detentionCapitalIncrement));
    opts.push_back(doubleOption("prison_criminal_capital_increment", model, "prison_criminal_capital_increment",
                                "capital added on conviction", &KernelConfig::prisonCapitalIncrement));
    opts.push_back(doubleOption("prison_release_capital_increment", model, "prison_release_capital_increment",
                                "capital added on prison release", &KernelConfig::prisonReleaseCapitalIncrement));

    opts.push_back(doubleOption("congestion_strength", model, "congestion_strength",
                                "new sentences *= 1 - s * prison share", &KernelConfig::sentenceCongestionStrength));
    opts.push_back(doubleOption("congestion_threshold", model, "congestion_threshold",
                                "prison share that triggers relief", &KernelConfig::congestionThreshold));
    opts.push_back(doubleOption("congestion_shortening", model, "congestion_shortening",
                                "fraction cut from remaining sentences", &KernelConfig::congestionShortening));

    opts.push_back(countOption("evidence_window_days", model, "evidence_window_days",
                               "rolling evidence window N", &KernelConfig::evidenceWindowDays));

    opts.push_back(flagOption("rewiring_enabled", rewiring, "enabled",
                              "rewire ties on custody entry", &KernelConfig::rewiringEnabled));
    opts.push_back(doubleOption("drop_lawful_edge_prob", rewiring, "drop_lawful_edge_prob",
                                "drop probability per LAWFUL tie", &KernelConfig::dropLawfulEdgeProb));
    opts.push_back(doubleOption("add_criminal_edge_prob", rewiring, "add_criminal_edge_prob",
                                "acceptance probability per new CRIMINAL tie", &KernelConfig::addCriminalEdgeProb));
    opts.push_back(countOption("max_new_edges_per_event", rewiring, "max_new_edges_per_event",
                               "max new CRIMINAL ties per event", &KernelConfig::maxNewEdgesPerEvent));
    return opts;
}

const ConfigOption& findOption(const std::string& key) {
    for (const auto& opt : configOptions()) {
        if (key == opt.key) return opt;
    }
    throw std::invalid_argument("unknown config key: '" + key + "'");
}

const ConfigOption* findField(const std::string& section, const std::string& field) {
    for (const auto& opt : configOptions()) {
        if (section == opt.section && field == opt.field) return &opt;
    }
    return nullptr;
}

// ---------- documents ----------

void loadSection(KernelConfig& cfg, const std::string& section, const YAML::Node& node) {
    if (node.IsNull()) return;
    if (!node.IsMap()) {
        throw std::invalid_argument(lineOf(node.Mark()) + ": section '" + section + "' must be a mapping");
    }
    for (const auto& entry : node) {
        const std::string field = entry.first.as<std::string>();
        if (section == "model" && field == "rewiring") {
            loadSection(cfg, "model.rewiring", entry.second);
            continue;
        }
        const ConfigOption* opt = findField(section, field);
        if (!opt) {
            throw std::invalid_argument(lineOf(entry.first.Mark()) + ": unknown config key '" +
                                        section + "." + field + "'");
        }
        opt->load(cfg, entry.second);
    }
}

KernelConfig loadDocument(const YAML::Node& root, const KernelConfig& base) {
    KernelConfig cfg = base;
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) {
        throw std::invalid_argument(lineOf(root.Mark()) + ": top level must be a mapping of sections");
    }
    try {
        for (const auto& entry : root) {
            const std::string section = entry.first.as<std::string>();
            if (section != "simulation" && section != "model") {
                throw std::invalid_argument(lineOf(entry.first.Mark()) + ": unknown config section '" +
                                            section + "'");
            }
            loadSection(cfg, section, entry.second);
        }
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument(lineOf(e.mark) + ": " + e.msg);
    }
    return cfg;
}

void emitSection(YAML::Emitter& out, const KernelConfig& cfg, const std::string& section) {
    for (const auto& opt : configOptions()) {
        if (section == opt.section) opt.emit(out, cfg);
    }
}

} // namespace

const std::vector<ConfigOption>& configOptions() {
    static const std::vector<ConfigOption> options = buildOptions();
    return options;
}

void applyConfigOption(KernelConfig& cfg, const std::string& key, const std::string& value) {
    findOption(trim(key)).set(cfg, value);
}

std::string configValue(const KernelConfig& cfg, const std::string& key) {
    return findOption(trim(key)).get(cfg);
}

bool applyOptionArgument(KernelConfig& cfg, const std::string& arg) {
    if (arg.rfind("--", 0) != 0) return false;
    const auto eq = arg.find('=');
    if (eq == std::string::npos) return false;
    applyConfigOption(cfg, arg.substr(2, eq - 2), arg.substr(eq + 1));
    return true;
}

KernelConfig readConfig(std::istream& in, const KernelConfig& base) {
    YAML::Node root;
    try {
        root = YAML::Load(in);
    } catch (const YAML::ParserException& e) {
        throw std::invalid_argument(lineOf(e.mark) + ": " + e.msg);
    }
    return loadDocument(root, base);
}

KernelConfig readConfigFile(const std::string& path, const KernelConfig& base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("could not open config file '" + path + "'");
    } catch (const YAML::ParserException& e) {
        throw std::invalid_argument(path + ": " + lineOf(e.mark) + ": " + e.msg);
    }
    return loadDocument(root, base);
}

void writeConfig(const KernelConfig& cfg, std::ostream& out) {
    YAML::Emitter yaml;
    yaml.SetDoublePrecision(12);

    yaml << YAML::BeginMap;
    yaml << YAML::Key << "simulation" << YAML::Value << YAML::BeginMap;
    emitSection(yaml, cfg, "simulation");
    yaml << YAML::EndMap;

    yaml << YAML::Key << "model" << YAML::Value << YAML::BeginMap;
    emitSection(yaml, cfg, "model");
    yaml << YAML::Key << "rewiring" << YAML::Value << YAML::BeginMap;
    emitSection(yaml, cfg, "model.rewiring");
    yaml << YAML::EndMap;
    yaml << YAML::EndMap;
    yaml << YAML::EndMap;

    if (!yaml.good()) {
        throw std::runtime_error("could not write config: " + yaml.GetLastError());
    }
    out << yaml.c_str() << "\n";
}
