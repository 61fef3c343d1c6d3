#include "pem_io.hpp"
#include "base64.hpp"
#include <fstream>
#include <stdexcept>

static const int kLineWidth = 64;
static const std::string kBegin = "-----BEGIN ";
static const std::string kEnd   = "-----END ";
static const std::string kDashes = "-----";

void write_pem(std::ostream& out,
               const std::string& type_header,
               const std::vector<uint8_t>& data)
{
    out << kBegin << type_header << kDashes << "\n";

    std::string encoded = base64_encode(data);
    for (size_t i = 0; i < encoded.size(); i += kLineWidth) {
        out << encoded.substr(i, kLineWidth) << '\n';
    }

    out << kEnd << type_header << kDashes << "\n";

    if (!out)
        throw std::runtime_error("Write error on PEM output");
}

void write_pem(const std::string& path,
               const std::string& type_header,
               const std::vector<uint8_t>& data)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open file for writing: " + path);

    write_pem(f, type_header, data);

    if (!f)
        throw std::runtime_error("Write error on file: " + path);
}

// Label of a "-----BEGIN <label>-----" line, or empty if line is not one.
static std::string begin_label(const std::string& line) {
    if (line.size() <= kBegin.size() + kDashes.size() ||
        line.compare(0, kBegin.size(), kBegin) != 0 ||
        line.compare(line.size() - kDashes.size(), kDashes.size(), kDashes) != 0)
        return "";
    return line.substr(kBegin.size(), line.size() - kBegin.size() - kDashes.size());
}

// Reads from the BEGIN line to the matching END line. An empty
// expected_type accepts the first BEGIN line of any label.
static std::vector<uint8_t> read_block(const std::string& path,
                                       const std::string& expected_type,
                                       std::string& type_out)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open file for reading: " + path);

    std::string line;
    bool found_begin = false;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string label = begin_label(line);
        if (label.empty()) continue;
        if (expected_type.empty() || label == expected_type) {
            type_out = label;
            found_begin = true;
            break;
        }
    }
    if (!found_begin) {
        if (expected_type.empty())
            throw std::runtime_error("No PEM block in: " + path);
        throw std::runtime_error("Missing or wrong PEM header in: " + path +
                                 "\n  Expected: " + kBegin + expected_type + kDashes);
    }

    std::string end_marker = kEnd + type_out + kDashes;
    std::string body;
    bool found_end = false;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == end_marker) { found_end = true; break; }
        body += line;
    }
    if (!found_end)
        throw std::runtime_error("Missing PEM footer in: " + path +
                                 "\n  Expected: " + end_marker);

    try {
        return base64_decode(body);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Bad PEM body in " + path + ": " + e.what());
    }
}

std::vector<uint8_t> read_pem(const std::string& path,
                              const std::string& expected_type)
{
    std::string type;
    return read_block(path, expected_type, type);
}

std::vector<uint8_t> read_pem_any(const std::string& path, std::string& type_out) {
    return read_block(path, "", type_out);
}
