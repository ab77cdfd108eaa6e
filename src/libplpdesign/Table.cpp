// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include <plpdesign/Util.hpp>
#include <plpdesign/Errors.hpp>
#include <plpdesign/Table.hpp>

namespace plpdesign {

Table::Table(std::vector<std::string> header, const char delim) : delim(delim), header(std::move(header)) {}

std::vector<std::string> Table::split_line(std::string const& line, const char delim) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.length(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.length() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"' && strstrip(field).empty()) {
            quoted = true;
            field.clear();
        } else if (c == delim) {
            fields.push_back(strstrip(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(strstrip(field));
    return fields;
}

Table Table::read(const std::string& filename) {
    std::ifstream infile(filename);
    if (!std::filesystem::is_regular_file(filename) || !infile) {
        throw PipelineError(ERR_INPUT_NOT_FOUND, filename + ": unable to open table");
    }
    std::string line;
    do {
        if (!std::getline(infile, line)) {
            throw PipelineError(ERR_INVALID_INPUT, filename + ": table is empty");
        }
    } while (strstrip(line).empty());
    // Sniff the delimiter from the header
    const char delim = line.find('\t') != std::string::npos ? '\t' : ',';
    Table result {split_line(line, delim), delim};
    result.path = filename;
    std::size_t lineno = 1;
    while (std::getline(infile, line)) {
        ++lineno;
        if (strstrip(line).empty()) {
            continue;
        }
        std::vector<std::string> row = split_line(line, delim);
        if (row.size() > result.header.size()) {
            throw PipelineError(ERR_INVALID_INPUT, filename + ":" + std::to_string(lineno) + ": more fields than header columns");
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

std::optional<std::size_t> Table::find_column(std::string const& name) const {
    auto it = std::find(header.cbegin(), header.cend(), name);
    if (it == header.cend()) {
        return {};
    }
    return it - header.cbegin();
}

std::size_t Table::column(std::string const& name) const {
    std::optional<std::size_t> idx = find_column(name);
    if (!idx) {
        throw PipelineError(ERR_INVALID_INPUT, (path.empty() ? "table" : path) + ": missing required column \"" + name + "\"");
    }
    return *idx;
}

std::string const& Table::cell(std::size_t row, std::size_t col) const {
    static const std::string empty {};
    std::vector<std::string> const& r = rows.at(row);
    return col < r.size() ? r[col] : empty;
}

Table& Table::add_row(std::vector<std::string> row) {
    if (row.size() != header.size()) {
        throw std::range_error("Table::add_row: row has " + std::to_string(row.size()) + " fields, expected " + std::to_string(header.size()));
    }
    rows.push_back(std::move(row));
    return *this;
}

void Table::write(const std::string& filename) const {
    std::filesystem::path fpath {filename};
    if (fpath.has_parent_path()) {
        std::filesystem::create_directories(fpath.parent_path());
    }
    std::ofstream outfile(filename);
    if (!outfile) {
        throw PipelineError(ERR_INPUT_NOT_FOUND, filename + ": unable to open for writing");
    }
    outfile << *this;
    BOOST_LOG_TRIVIAL(debug) << "Wrote " << rows.size() << " rows to " << filename;
}

std::ostream& operator<<(std::ostream& strm, Table const& me) {
    const std::string sep (1, me.delim);
    strm << strjoin(me.header, sep) << "\n";
    for (const std::vector<std::string>& row : me.rows) {
        strm << strjoin(row, sep) << "\n";
    }
    return strm;
}

long long parse_integer(std::string const& s, std::string const& context) {
    std::size_t pos = 0;
    long long value;
    try {
        value = std::stoll(s, &pos);
    } catch (const std::exception&) {
        throw PipelineError(ERR_INVALID_INPUT, context + ": not an integer: \"" + s + "\"");
    }
    if (pos != s.length()) {
        throw PipelineError(ERR_INVALID_INPUT, context + ": not an integer: \"" + s + "\"");
    }
    return value;
}

std::vector<std::string> read_gene_list(const std::string& filename) {
    Table table = Table::read(filename);
    const std::size_t col = table.column("Gene");
    std::vector<std::string> genes;
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < table.size(); ++i) {
        std::string const& gene = table.cell(i, col);
        if (gene.empty()) {
            continue;
        }
        if (!seen.insert(gene).second) {
            BOOST_LOG_TRIVIAL(warning) << filename << ": duplicate gene " << gene << " ignored";
            continue;
        }
        genes.push_back(gene);
    }
    if (genes.empty()) {
        throw PipelineError(ERR_INVALID_INPUT, filename + ": no genes listed");
    }
    return genes;
}
}
