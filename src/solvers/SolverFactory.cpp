#include "solvers/SolverFactory.hpp"
#include "solvers/CashKarpSolverStrategy.hpp"
#include "solvers/Dopri5SolverStrategy.hpp"
#include "solvers/FehlbergSolverStrategy.hpp"
#include "solvers/GslSolverStrategy.hpp"
#include "solvers/RungeKutta4SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>

namespace dynsys {

namespace {

    using Creator = std::function<std::shared_ptr<IOdeSolverStrategy>()>;

    const std::map<std::string, Creator>& registry() {
        static const std::map<std::string, Creator> creators = {
            {"dopri5",      [] { return std::make_shared<Dopri5SolverStrategy>(); }},
            {"cash_karp54", [] { return std::make_shared<CashKarpSolverStrategy>(); }},
            {"fehlberg78",  [] { return std::make_shared<FehlbergSolverStrategy>(); }},
            {"rk4",         [] { return std::make_shared<RungeKutta4SolverStrategy>(); }},
            {"rkf45",       [] { return std::make_shared<GslSolverStrategy>("rkf45", gsl_odeiv2_step_rkf45, false); }},
            {"rk8pd",       [] { return std::make_shared<GslSolverStrategy>("rk8pd", gsl_odeiv2_step_rk8pd, false); }},
            {"msbdf",       [] { return std::make_shared<GslSolverStrategy>("msbdf", gsl_odeiv2_step_msbdf, true); }},
            {"bsimp",       [] { return std::make_shared<GslSolverStrategy>("bsimp", gsl_odeiv2_step_bsimp, true); }},
        };
        return creators;
    }

    std::string toLower(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return name;
    }

} // namespace

std::shared_ptr<IOdeSolverStrategy> SolverFactory::create(const std::string& name) {
    const auto& creators = registry();
    auto it = creators.find(toLower(name));
    if (it == creators.end()) {
        std::string known;
        for (const auto& entry : creators) {
            known += (known.empty() ? "" : ", ") + entry.first;
        }
        std::string msg = "Unknown solver algorithm '" + name + "'. Available: " + known + ".";
        Logger::getInstance().error("SolverFactory::create", msg);
        DYNSYS_THROW_SOLVER_ERROR("SolverFactory::create", msg);
    }
    return it->second();
}

std::vector<std::string> SolverFactory::availableSolvers() {
    std::vector<std::string> names;
    for (const auto& entry : registry()) {
        names.push_back(entry.first);
    }
    return names;
}

bool SolverFactory::isAvailable(const std::string& name) {
    return registry().count(toLower(name)) > 0;
}

} // namespace dynsys
