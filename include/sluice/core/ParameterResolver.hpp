#pragma once

/**
 * @file ParameterResolver.hpp
 * @brief Lookup service mapping parameter references to numeric values
 *
 * The graph-build phase receives a resolver explicitly; nothing in the core
 * looks parameters up through global state.
 */

#include <sluice/core/Error.hpp>
#include <sluice/core/NodeConfig.hpp>

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace sluice {

/// A resolved parameter: a scalar or a vector of doubles
using ParameterValue = std::variant<double, std::vector<double>>;

/**
 * @brief Parameter resolver interface
 */
class ParameterResolver {
  public:
    virtual ~ParameterResolver() = default;

    /**
     * @brief Resolve a reference to its numeric value
     * @throws UnknownParameterError if the reference cannot be resolved
     */
    [[nodiscard]] virtual ParameterValue Resolve(const std::string &reference) const = 0;

    [[nodiscard]] virtual bool Has(const std::string &reference) const = 0;
};

/**
 * @brief Resolver backed by named tables of constants
 *
 * References take the form "table.KEY", e.g. "asm1_init.QINTR". The key may
 * itself contain dots; only the first dot separates the table name.
 */
class TableParameterResolver : public ParameterResolver {
  public:
    struct Table {
        std::map<std::string, double> scalars;
        std::map<std::string, std::vector<double>> vectors;
    };

    void AddTable(const std::string &name, Table table) { tables_[name] = std::move(table); }

    void SetScalar(const std::string &table, const std::string &key, double value) {
        tables_[table].scalars[key] = value;
    }

    void SetVector(const std::string &table, const std::string &key, std::vector<double> value) {
        tables_[table].vectors[key] = std::move(value);
    }

    [[nodiscard]] bool HasTable(const std::string &name) const { return tables_.count(name) > 0; }
    [[nodiscard]] std::size_t NumTables() const { return tables_.size(); }

    [[nodiscard]] ParameterValue Resolve(const std::string &reference) const override {
        auto dot = reference.find('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 == reference.size()) {
            throw UnknownParameterError(reference, "expected 'table.KEY'");
        }
        std::string table_name = reference.substr(0, dot);
        std::string key = reference.substr(dot + 1);

        auto tit = tables_.find(table_name);
        if (tit == tables_.end()) {
            throw UnknownParameterError(reference, "no table '" + table_name + "'");
        }
        const Table &table = tit->second;
        if (auto sit = table.scalars.find(key); sit != table.scalars.end()) {
            return sit->second;
        }
        if (auto vit = table.vectors.find(key); vit != table.vectors.end()) {
            return vit->second;
        }
        throw UnknownParameterError(reference,
                                    "table '" + table_name + "' has no key '" + key + "'");
    }

    [[nodiscard]] bool Has(const std::string &reference) const override {
        auto dot = reference.find('.');
        if (dot == std::string::npos) {
            return false;
        }
        auto tit = tables_.find(reference.substr(0, dot));
        if (tit == tables_.end()) {
            return false;
        }
        std::string key = reference.substr(dot + 1);
        return tit->second.scalars.count(key) > 0 || tit->second.vectors.count(key) > 0;
    }

  private:
    std::map<std::string, Table> tables_;
};

/**
 * @brief Replace a node's parameter references with resolved values
 *
 * Scalars land in NodeConfig::scalars, vectors in NodeConfig::vectors. The
 * references map is cleared afterwards.
 *
 * @throws UnknownParameterError naming the node and reference on failure
 */
inline void ResolveParameters(NodeConfig &config, const ParameterResolver &resolver) {
    for (const auto &[param, reference] : config.references) {
        ParameterValue value;
        try {
            value = resolver.Resolve(reference);
        } catch (const UnknownParameterError &) {
            throw UnknownParameterError(reference,
                                        "node '" + config.id + "' parameter '" + param + "'");
        }
        if (std::holds_alternative<double>(value)) {
            config.scalars[param] = std::get<double>(value);
        } else {
            config.vectors[param] = std::get<std::vector<double>>(value);
        }
    }
    config.references.clear();
}

} // namespace sluice
