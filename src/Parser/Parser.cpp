/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file Parser.cpp
 * @brief Implementation of the Parser declared in Parser.hpp.
 *
 * Netlists are read line by line: each line is uppercased, comments are
 * stripped, directives are handled in place and element lines are handed to
 * the element factory (`CircuitElement::parse`). JSON component lists are
 * read with nlohmann::json and turned into the same element objects.
 *
 * Keep API-level documentation in the header (`Parser.hpp`).
 */

#include "Parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <unordered_map>

#include "CircuitElement.hpp"
#include "CircuitErrors.hpp"
#include "CurrentSource.hpp"
#include "Resistor.hpp"
#include "Solver.hpp"
#include "VoltageSource.hpp"

using json = nlohmann::json;

void Parser::clear()
{
    circuitElements.clear();
    elementMap.clear();
    elementCounts = ElementCounts();
}

void Parser::countElement(const CircuitElement& element)
{
    switch (element.getType()) {
        case ElementType::R:
            ++elementCounts.resistorCount;
            break;
        case ElementType::V:
            ++elementCounts.voltageSourceCount;
            break;
        case ElementType::I:
            ++elementCounts.currentSourceCount;
            break;
    }
}

int Parser::parse(const std::string& fileName, SolverDirectiveType& directive)
{
    std::ifstream fileStream(fileName);
    if (!fileStream) {
        std::cerr << "Error: Netlist " << fileName << " could not be opened"
                  << std::endl;
        return 1;
    }

    std::string line;
    int lineNumber = 0;
    int errorCount = 0;
    bool hasGround = false;

    // Clear previous data
    clear();

    // Splits on whitespace and drops inline comments
    auto tokenizeLine = [](const std::string& ln) {
        std::vector<std::string> tokens;
        std::string cur;
        for (char c : ln) {
            if (c == '*' || c == ';') break;
            if (std::isspace((unsigned char)c)) {
                if (!cur.empty()) {
                    tokens.push_back(cur);
                    cur.clear();
                }
                continue;
            }
            cur.push_back(c);
        }
        if (!cur.empty()) tokens.push_back(cur);
        return tokens;
    };

    while (std::getline(fileStream, line)) {
        lineNumber++;

        // Skip empty or comment-only lines quickly by checking first non-space
        size_t firstChar = line.find_first_not_of(" \t\r\n");
        if (firstChar == std::string::npos) continue;  // blank line
        char fc = line[firstChar];
        if (fc == '*' || fc == ';') continue;  // comment line

        // Convert line to uppercase for uniformity
        std::string up = line;
        std::transform(up.begin(), up.end(), up.begin(), ::toupper);

        std::vector<std::string> tokens = tokenizeLine(up);
        if (tokens.empty()) continue;

        if (tokens[0] == ".END") break;

        if (tokens[0] == ".OP") {
            if (directive != SolverDirectiveType::NONE) {
                std::cerr << "Warning: Multiple directives found. Using the "
                             "first one."
                          << std::endl;
            }
            directive = SolverDirectiveType::OPERATING_POINT;
            continue;
        }

        if (tokens[0][0] == '.') {
            std::cerr << "Line " << lineNumber << ": Unsupported directive '"
                      << tokens[0] << "'" << std::endl;
            ++errorCount;
            continue;
        }

        std::shared_ptr<CircuitElement> element =
            CircuitElement::parse(*this, tokens, lineNumber);
        if (!element) {
            ++errorCount;
            continue;
        }

        if (elementMap.find(element->getName()) != elementMap.end()) {
            std::cerr << "Error: Duplicate element name '" << element->getName()
                      << "' at line " << lineNumber << std::endl;
            ++errorCount;
            continue;
        }

        if (isGroundLabel(element->getNodeA()) ||
            isGroundLabel(element->getNodeB()))
            hasGround = true;

        countElement(*element);
        circuitElements.push_back(element);
        elementMap[element->getName()] = element;
    }

    if (circuitElements.empty() && errorCount == 0) {
        std::cerr << "Error: Netlist contains no elements" << std::endl;
        errorCount++;
    } else if (!hasGround) {
        // Check for ground node
        std::cerr << "Error: Circuit must contain ground (0)" << std::endl;
        errorCount++;
    }

    return errorCount;
}

// Lowercase and trim a component type for alias lookup.
static std::string normalizeType(const std::string& type)
{
    size_t first = type.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = type.find_last_not_of(" \t");
    std::string out = type.substr(first, last - first + 1);
    for (auto& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

static bool lookupType(const std::string& type, ElementType& out)
{
    static const std::unordered_map<std::string, ElementType> aliases = {
        {"resistor", ElementType::R},
        {"r", ElementType::R},
        {"voltage source", ElementType::V},
        {"voltagesource", ElementType::V},
        {"voltage", ElementType::V},
        {"vs", ElementType::V},
        {"v", ElementType::V},
        {"current source", ElementType::I},
        {"currentsource", ElementType::I},
        {"current", ElementType::I},
        {"cs", ElementType::I},
        {"i", ElementType::I}};

    auto it = aliases.find(normalizeType(type));
    if (it == aliases.end()) return false;
    out = it->second;
    return true;
}

static std::string componentNode(const json& entry, const char* key,
                                 const std::string& where)
{
    if (!entry.contains(key))
        throw ValidationError(where + " is missing '" + key + "'");
    const json& node = entry.at(key);
    if (node.is_string()) return node.get<std::string>();
    if (node.is_number_integer()) return std::to_string(node.get<long long>());
    throw ValidationError(where + ": '" + key +
                          "' must be a string or an integer");
}

void Parser::parseJson(const json& document)
{
    clear();

    const json* components = nullptr;
    if (document.is_array()) {
        components = &document;
    } else if (document.is_object() && document.contains("components") &&
               document.at("components").is_array()) {
        components = &document.at("components");
    } else {
        throw ValidationError(
            "Circuit JSON must be an array or an object with a 'components' "
            "array");
    }

    std::map<ElementType, int> autoNumber;
    for (size_t index = 0; index < components->size(); ++index) {
        const json& entry = (*components)[index];
        const std::string where = "Component #" + std::to_string(index + 1);

        if (!entry.is_object())
            throw ValidationError(where + " must be an object");
        if (!entry.contains("type") || !entry.at("type").is_string())
            throw ValidationError(where + " is missing a string 'type'");

        ElementType type;
        const std::string typeText = entry.at("type").get<std::string>();
        if (!lookupType(typeText, type))
            throw ValidationError(where + " has unknown type '" + typeText +
                                  "'");

        if (!entry.contains("value"))
            throw ValidationError(where + " is missing 'value'");
        const json& rawValue = entry.at("value");
        double value = 0.0;
        if (rawValue.is_number()) {
            value = rawValue.get<double>();
        } else if (rawValue.is_string()) {
            std::string text = rawValue.get<std::string>();
            std::transform(text.begin(), text.end(), text.begin(), ::toupper);
            bool valid = false;
            value = parseValue(text, static_cast<int>(index + 1), valid);
            if (!valid)
                throw ValidationError(where + " has invalid value '" +
                                      rawValue.get<std::string>() + "'");
        } else {
            throw ValidationError(where +
                                  ": 'value' must be a number or a string");
        }
        if (!std::isfinite(value))
            throw ValidationError(where + " has a non-finite value");

        std::string nodeA = componentNode(entry, "nodeA", where);
        std::string nodeB = componentNode(entry, "nodeB", where);

        std::string name;
        int number = ++autoNumber[type];
        if (entry.contains("name") && entry.at("name").is_string() &&
            !entry.at("name").get<std::string>().empty()) {
            name = entry.at("name").get<std::string>();
        } else {
            std::ostringstream os;
            os << type << number;
            name = os.str();
        }

        std::shared_ptr<CircuitElement> element;
        switch (type) {
            case ElementType::R:
                element = std::make_shared<Resistor>(name, nodeA, nodeB, value);
                break;
            case ElementType::V:
                element =
                    std::make_shared<VoltageSource>(name, nodeA, nodeB, value);
                break;
            case ElementType::I:
                element =
                    std::make_shared<CurrentSource>(name, nodeA, nodeB, value);
                break;
        }

        countElement(*element);
        circuitElements.push_back(element);
        elementMap[name] = element;
    }
}

void Parser::parseJsonFile(const std::string& file)
{
    std::ifstream fileStream(file);
    if (!fileStream)
        throw std::runtime_error("Circuit file " + file +
                                 " could not be opened");

    json document;
    try {
        document = json::parse(fileStream);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Invalid JSON in ") + file + ": " +
                              e.what());
    }
    parseJson(document);
}

bool Parser::validateTokens(const std::vector<std::string>& tokens,
                            int expectedSize, int lineNumber)
{
    if (tokens.size() != expectedSize) {
        std::cerr << "Line " << lineNumber << ": Expected " << expectedSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

bool Parser::validateNodes(const std::string& nodeA, const std::string& nodeB,
                           int lineNumber)
{
    if (nodeA == nodeB) {
        std::cerr << "Line " << lineNumber
                  << ": NodeA and NodeB cannot be the same (" << nodeA << ")"
                  << std::endl;
        return false;
    }
    return true;
}

double Parser::parseValue(const std::string& valueStr, int lineNumber,
                          bool& valid)
{
    // Strict SPICE-style parsing:
    // - Recognize common suffixes (T, G, MEG, K, M, U, N, P, F).
    // - Require a non-empty mantissa.
    // - Require that the mantissa is fully consumed by std::stod (no stray
    //   characters like extra '.' or trailing digits), so the numeric
    //   literal must be well-formed.
    // - If a suffix exists, it must be one of the recognized suffixes and the
    //   mantissa must also be a fully-formed numeric literal.
    //
    // This matches LTspice behavior where malformed numbers such as "1.2.3"
    // are rejected.

    if (valueStr.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    // Map of recognized suffixes (uppercase) -> multiplier
    static const std::unordered_map<std::string, double> suffixMap = {
        {"T", 1e12}, {"G", 1e9},  {"MEG", 1e6}, {"K", 1e3},  {"M", 1e-3},
        {"U", 1e-6}, {"N", 1e-9}, {"P", 1e-12}, {"F", 1e-15}};

    // Separate trailing alphabetic suffix (if any). We accept up to 3 letters
    // (to support MEG). valueStr is uppercased by the caller earlier in the
    // pipeline; the suffix is uppercased here as well.
    size_t pos = valueStr.size();
    while (pos > 0 && std::isalpha((unsigned char)valueStr[pos - 1])) --pos;

    std::string mantissa = valueStr.substr(0, pos);
    std::string suffix = valueStr.substr(pos);

    // Mantissa must not be empty (e.g., "K" is invalid)
    if (mantissa.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    // Normalize suffix to uppercase
    for (auto& c : suffix) c = (char)std::toupper((unsigned char)c);

    // Helper to parse a mantissa and require full consumption of the string
    auto parseMantissaStrict = [&](const std::string& m, double& out) -> bool {
        try {
            size_t idx = 0;
            out = std::stod(m, &idx);
            // require std::stod consumed the whole mantissa string
            if (idx != m.size()) {
                return false;
            }
            return true;
        } catch (const std::exception&) {
            return false;
        }
    };

    // If no suffix, parse mantissa strictly
    if (suffix.empty()) {
        double value = 0.0;
        if (!parseMantissaStrict(mantissa, value)) {
            std::cerr << "Line " << lineNumber << ": Invalid value '"
                      << valueStr << "'" << std::endl;
            valid = false;
            return 0.0;
        }
        valid = true;
        return value;
    }

    // Suffix present: must be recognized
    auto it = suffixMap.find(suffix);
    if (it == suffixMap.end()) {
        std::cerr << "Line " << lineNumber << ": Unknown suffix '" << suffix
                  << "' in value '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    // Parse mantissa strictly, then scale
    double base = 0.0;
    if (!parseMantissaStrict(mantissa, base)) {
        std::cerr << "Line " << lineNumber << ": Invalid numeric part '"
                  << mantissa << "' in '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    double value = base * it->second;
    valid = true;
    return value;
}

void Parser::printElementCounts(std::ostream& os) const
{
    os << "Total Resistors: " << elementCounts.resistorCount << std::endl;
    os << "Total Voltage Sources: " << elementCounts.voltageSourceCount
       << std::endl;
    os << "Total Current Sources: " << elementCounts.currentSourceCount
       << std::endl;
}
