#include "DataLoader.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace sigproj {
namespace loading {

namespace {

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::vector<std::string> splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.push_back(trim(token));
    }
    if (!line.empty() && line.back() == delimiter) {
        tokens.push_back("");
    }
    return tokens;
}

std::ifstream openFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataLoadingError("Cannot open file: " + path);
    }
    return file;
}

double parseValue(const std::string& token, const std::string& path, int lineNumber) {
    try {
        size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::exception&) {
        throw DataLoadingError(path + ":" + std::to_string(lineNumber) +
                               ": invalid numeric value '" + token + "'");
    }
}

bool hasExtension(const std::string& path, const std::string& extension) {
    if (path.size() < extension.size()) {
        return false;
    }
    std::string tail = path.substr(path.size() - extension.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == extension;
}

} // namespace

DataMatrix loadExpressionMatrix(const std::string& path) {
    std::ifstream file = openFile(path);

    std::string line;
    if (!std::getline(file, line)) {
        throw DataLoadingError("Expression file is empty: " + path);
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    char delimiter = line.find('\t') != std::string::npos ? '\t' : ',';

    // The first header cell labels the gene column
    std::vector<std::string> header = splitLine(line, delimiter);
    if (header.size() < 2) {
        throw DataLoadingError("Expression file has no sample columns: " + path);
    }
    std::vector<std::string> samples(header.begin() + 1, header.end());

    std::vector<std::string> genes;
    std::vector<std::vector<double>> rows;
    std::set<std::string> seenGenes;
    int lineNumber = 1;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> tokens = splitLine(line, delimiter);
        if (tokens.size() != header.size()) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) + ": expected " +
                                   std::to_string(header.size()) + " fields, found " +
                                   std::to_string(tokens.size()));
        }
        if (!seenGenes.insert(tokens[0]).second) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) + ": duplicate gene " + tokens[0]);
        }

        genes.push_back(tokens[0]);
        std::vector<double> row;
        row.reserve(samples.size());
        for (size_t j = 1; j < tokens.size(); ++j) {
            row.push_back(parseValue(tokens[j], path, lineNumber));
        }
        rows.push_back(row);
    }

    if (rows.empty()) {
        throw DataLoadingError("Expression file has no gene rows: " + path);
    }

    Eigen::MatrixXd values(rows.size(), samples.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < rows[i].size(); ++j) {
            values(i, j) = rows[i][j];
        }
    }
    return DataMatrix(values, genes, samples);
}

int parseSign(const std::string& token) {
    std::string sign = token;
    std::transform(sign.begin(), sign.end(), sign.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (sign == "plus" || sign == "+1" || sign == "1" || sign == "+") {
        return 1;
    } else if (sign == "minus" || sign == "-1" || sign == "-") {
        return -1;
    } else if (sign == "both" || sign == "0") {
        return 0;
    }
    throw DataLoadingError("Unknown signature sign: " + token);
}

std::vector<Signature> loadGMT(const std::string& path) {
    std::ifstream file = openFile(path);
    std::vector<Signature> signatures;
    std::set<std::string> names;

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (trim(line).empty()) {
            continue;
        }
        std::vector<std::string> tokens = splitLine(line, '\t');
        if (tokens.size() < 3) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) +
                                   ": a GMT line needs a name, a description and genes");
        }
        if (!names.insert(tokens[0]).second) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) +
                                   ": duplicate signature " + tokens[0]);
        }

        std::map<std::string, int> genes;
        for (size_t i = 2; i < tokens.size(); ++i) {
            if (!tokens[i].empty()) {
                genes[tokens[i]] = 1;
            }
        }
        signatures.emplace_back(genes, false, path, tokens[0]);
    }
    return signatures;
}

std::vector<Signature> loadSignatureTable(const std::string& path) {
    std::ifstream file = openFile(path);

    // Keeps the file's order of first appearance
    std::vector<std::string> order;
    std::map<std::string, std::map<std::string, int>> members;

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        std::vector<std::string> tokens = splitLine(content, '\t');
        if (tokens.size() != 3) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) +
                                   ": expected name, sign and gene");
        }

        int sign = 0;
        try {
            sign = parseSign(tokens[1]);
        } catch (const DataLoadingError& e) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) + ": " + e.what());
        }
        // "both" genes are scored with a positive sign
        if (sign == 0) {
            sign = 1;
        }

        if (members.find(tokens[0]) == members.end()) {
            order.push_back(tokens[0]);
        }
        members[tokens[0]][tokens[2]] = sign;
    }

    std::vector<Signature> signatures;
    for (const auto& name : order) {
        const auto& genes = members[name];
        bool isSigned = std::any_of(genes.begin(), genes.end(),
                                    [](const std::pair<const std::string, int>& g) { return g.second < 0; });
        signatures.emplace_back(genes, isSigned, path, name);
    }
    return signatures;
}

std::vector<Signature> loadSignatures(const std::string& path) {
    if (hasExtension(path, ".gmt")) {
        return loadGMT(path);
    }
    return loadSignatureTable(path);
}

std::vector<std::string> loadHousekeepingGenes(const std::string& path) {
    std::ifstream file = openFile(path);
    std::vector<std::string> genes;
    std::string line;
    while (std::getline(file, line)) {
        std::string gene = trim(line);
        if (!gene.empty() && gene[0] != '#') {
            genes.push_back(gene);
        }
    }
    return genes;
}

std::map<std::string, SignatureScore> loadPrecomputedSignatures(const std::string& path) {
    std::ifstream file = openFile(path);

    std::string line;
    if (!std::getline(file, line)) {
        throw DataLoadingError("Precomputed signature file is empty: " + path);
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::vector<std::string> samples = splitLine(line, '\t');

    // Headers may or may not leave two cells for the name and type columns
    while (!samples.empty() && (samples.front().empty() || samples.front() == "Name" ||
                                samples.front() == "Type")) {
        samples.erase(samples.begin());
    }
    if (samples.empty()) {
        throw DataLoadingError("Precomputed signature file has no sample labels: " + path);
    }

    std::map<std::string, SignatureScore> scores;
    int lineNumber = 1;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> tokens = splitLine(line, '\t');
        if (tokens.size() != samples.size() + 2) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) + ": expected " +
                                   std::to_string(samples.size() + 2) + " fields, found " +
                                   std::to_string(tokens.size()));
        }

        const std::string& name = tokens[0];
        std::string type = tokens[1];
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (scores.count(name)) {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) + ": duplicate signature " + name);
        }

        if (type == "numerical") {
            Eigen::VectorXd values(samples.size());
            for (size_t j = 0; j < samples.size(); ++j) {
                values(j) = parseValue(tokens[j + 2], path, lineNumber);
            }
            scores[name] = SignatureScore(name, samples, values, false, true, 0);
        } else if (type == "factor") {
            std::vector<std::string> levels(tokens.begin() + 2, tokens.end());
            scores[name] = SignatureScore::fromFactorLevels(name, samples, levels);
        } else {
            throw DataLoadingError(path + ":" + std::to_string(lineNumber) +
                                   ": signature type must be numerical or factor, not " + tokens[1]);
        }
    }
    return scores;
}

} // namespace loading
} // namespace sigproj
