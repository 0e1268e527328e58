#ifndef PLANCOMP_METRICS_H
#define PLANCOMP_METRICS_H

#include <map>
#include <string>
#include <vector>

#include "data/node.h"

enum class MetricKind {
    MINIMIZE_ACTION_COSTS,
    MINIMIZE_EXPRESSION_ON_FINAL_STATE,
    MAXIMIZE_EXPRESSION_ON_FINAL_STATE,
    MINIMIZE_SEQUENTIAL_PLAN_LENGTH,
    MINIMIZE_MAKESPAN,
    OVERSUBSCRIPTION
};

/*
 * Plan quality metric. Only the fields of the respective kind are set:
 * action costs (by action name, with an optional default cost), the
 * expression evaluated on the final state, or the gain of each goal.
 */
struct QualityMetric {
    MetricKind kind;
    std::map<std::string, Expr> costs;
    Expr defaultCost;
    Expr expression;
    std::vector<std::pair<Expr, Expr>> gains;

    explicit QualityMetric(MetricKind kind) : kind(kind) {}

    static QualityMetric minimizeActionCosts(const std::map<std::string, Expr>& costs, Expr defaultCost = Expr()) {
        QualityMetric m(MetricKind::MINIMIZE_ACTION_COSTS);
        m.costs = costs;
        m.defaultCost = defaultCost;
        return m;
    }
    static QualityMetric minimizeExpression(Expr e) {
        QualityMetric m(MetricKind::MINIMIZE_EXPRESSION_ON_FINAL_STATE);
        m.expression = e;
        return m;
    }
    static QualityMetric maximizeExpression(Expr e) {
        QualityMetric m(MetricKind::MAXIMIZE_EXPRESSION_ON_FINAL_STATE);
        m.expression = e;
        return m;
    }
    static QualityMetric minimizePlanLength() {
        return QualityMetric(MetricKind::MINIMIZE_SEQUENTIAL_PLAN_LENGTH);
    }
    static QualityMetric minimizeMakespan() {
        return QualityMetric(MetricKind::MINIMIZE_MAKESPAN);
    }
    static QualityMetric oversubscription(const std::vector<std::pair<Expr, Expr>>& gains) {
        QualityMetric m(MetricKind::OVERSUBSCRIPTION);
        m.gains = gains;
        return m;
    }

    // Cost of the action of the given name, or an invalid expression
    Expr cost(const std::string& actionName) const {
        auto it = costs.find(actionName);
        return it != costs.end() ? it->second : defaultCost;
    }

    bool isActionCosts() const {return kind == MetricKind::MINIMIZE_ACTION_COSTS;}
};

#endif
