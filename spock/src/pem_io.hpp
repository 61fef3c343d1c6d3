#pragma once
#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

// Signature armor labels.
static const char kP1363SigLabel[] = "ECDSA P1363 SIGNATURE";
static const char kDerSigLabel[]   = "ECDSA DER SIGNATURE";

// Write PEM-like armor to a stream.
// type_header: e.g. "ECDSA DER SIGNATURE"
void write_pem(std::ostream& out,
               const std::string& type_header,
               const std::vector<uint8_t>& data);

// Write PEM-like armor to a file.
void write_pem(const std::string& path,
               const std::string& type_header,
               const std::vector<uint8_t>& data);

// Read and decode a PEM-like armored file whose BEGIN line must carry
// expected_type.
std::vector<uint8_t> read_pem(const std::string& path,
                              const std::string& expected_type);

// Read the first armored block of any type; its label goes to type_out.
std::vector<uint8_t> read_pem_any(const std::string& path, std::string& type_out);
