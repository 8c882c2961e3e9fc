#include "utils/ReadSolverConfiguration.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace dynsys {

namespace {

    const char* const SOURCE = "readSolverConfiguration";

    std::string where(const std::string& key, int line_number) {
        return "'" + key + "' on line " + std::to_string(line_number);
    }

    std::vector<std::string> readTokens(std::istringstream& iss) {
        std::vector<std::string> tokens;
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    double parseNumber(const std::string& token, const std::string& key, int line_number) {
        std::istringstream iss(token);
        double value = 0.0;
        char trailing;
        if (!(iss >> value) || (iss >> trailing)) {
            throw DataFormatException(SOURCE, "Invalid numeric value '" + token + "' for " + where(key, line_number));
        }
        return value;
    }

    const std::string& singleToken(const std::vector<std::string>& tokens, const std::string& key, int line_number) {
        if (tokens.empty()) {
            throw DataFormatException(SOURCE, "Missing value for " + where(key, line_number));
        }
        if (tokens.size() > 1) {
            throw DataFormatException(SOURCE, "Too many values provided for " + where(key, line_number));
        }
        return tokens.front();
    }

    double parsePositive(const std::vector<std::string>& tokens, const std::string& key, int line_number) {
        double value = parseNumber(singleToken(tokens, key, line_number), key, line_number);
        if (!(value > 0.0)) {
            throw DataFormatException(SOURCE, "Value for " + where(key, line_number) + " must be positive.");
        }
        return value;
    }

    bool parseBool(const std::vector<std::string>& tokens, const std::string& key, int line_number) {
        const std::string& token = singleToken(tokens, key, line_number);
        if (token == "true" || token == "1") return true;
        if (token == "false" || token == "0") return false;
        throw DataFormatException(SOURCE, "Invalid boolean value '" + token + "' for " + where(key, line_number) +
                                  ". Expected true, false, 1 or 0.");
    }

    std::size_t parseCount(const std::vector<std::string>& tokens, const std::string& key, int line_number) {
        const std::string& token = singleToken(tokens, key, line_number);
        if (token.find_first_not_of("0123456789") != std::string::npos) {
            throw DataFormatException(SOURCE, "Invalid integer value '" + token + "' for " + where(key, line_number));
        }
        std::size_t value = 0;
        try {
            value = static_cast<std::size_t>(std::stoull(token));
        } catch (const std::out_of_range&) {
            throw DataFormatException(SOURCE, "Integer value '" + token + "' too large for " + where(key, line_number));
        }
        if (value == 0) {
            throw DataFormatException(SOURCE, "Value for " + where(key, line_number) + " must be positive.");
        }
        return value;
    }

    std::vector<double> parseList(const std::vector<std::string>& tokens, const std::string& key, int line_number) {
        if (tokens.empty()) {
            throw DataFormatException(SOURCE, "Missing value for " + where(key, line_number));
        }
        std::vector<double> values;
        values.reserve(tokens.size());
        for (const auto& token : tokens) {
            values.push_back(parseNumber(token, key, line_number));
        }
        return values;
    }

} // namespace

SolverConfig readSolverConfiguration(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::getInstance().error(SOURCE, "Unable to open solver settings file: " + filename);
        throw FileIOException(SOURCE, "Unable to open solver settings file: " + filename);
    }

    SolverConfig config;
    SolverOptions& options = config.options;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number++;

        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = FileUtils::trim(line);
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string key;
        iss >> key;
        const std::vector<std::string> tokens = readTokens(iss);

        if (key == "solver") {
            config.solver = singleToken(tokens, key, line_number);
        } else if (key == "abstol") {
            options.abstol = parsePositive(tokens, key, line_number);
        } else if (key == "reltol") {
            options.reltol = parsePositive(tokens, key, line_number);
        } else if (key == "dt") {
            options.dt = parsePositive(tokens, key, line_number);
        } else if (key == "dtmax") {
            options.dtmax = parsePositive(tokens, key, line_number);
        } else if (key == "saveat") {
            options.saveat = parseList(tokens, key, line_number);
        } else if (key == "tstops") {
            options.tstops = parseList(tokens, key, line_number);
        } else if (key == "save_everystep") {
            options.save_everystep = parseBool(tokens, key, line_number);
        } else if (key == "save_first") {
            options.save_first = parseBool(tokens, key, line_number);
        } else if (key == "maxiters") {
            options.maxiters = parseCount(tokens, key, line_number);
        } else {
            Logger::getInstance().warning(SOURCE, "Ignoring unknown setting " + where(key, line_number));
        }
    }

    Logger::getInstance().debug(SOURCE, "Read solver settings from " + filename);
    return config;
}

} // namespace dynsys
