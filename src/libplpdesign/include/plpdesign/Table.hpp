// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_TABLE_H
#define PLPDESIGN_TABLE_H

#include <string>
#include <vector>
#include <optional>
#include <iostream>

namespace plpdesign {
    // Header-addressed delimited table (CSV or TSV). The delimiter of an input file is sniffed from its header line.
    class Table {
        std::string path;
        char delim;
        std::vector<std::string> header;
        std::vector<std::vector<std::string>> rows;

        static std::vector<std::string> split_line(std::string const& line, const char delim);
    public:
        explicit Table(std::vector<std::string> header, const char delim = '\t');

        // Read a table from disk
        //  Throws:
        //    PipelineError(ERR_INPUT_NOT_FOUND) if the file can't be opened
        //    PipelineError(ERR_INVALID_INPUT) if it is empty or a row is wider than the header
        static Table read(const std::string& filename);

        // Index of the named column. Throws PipelineError(ERR_INVALID_INPUT) naming the file if it is absent.
        std::size_t column(std::string const& name) const;
        std::optional<std::size_t> find_column(std::string const& name) const;

        // Cell accessor; short rows read as empty cells
        std::string const& cell(std::size_t row, std::size_t col) const;

        Table& add_row(std::vector<std::string> row);
        void write(const std::string& filename) const;

        const std::vector<std::string>& get_header() const {return header;}
        const std::vector<std::vector<std::string>>& get_rows() const {return rows;}
        const std::string& get_path() const {return path;}
        std::size_t size() const {return rows.size();}

        friend std::ostream& operator<<(std::ostream& strm, Table const& me);
    };

    // Parse an integer cell, naming the source in the error
    long long parse_integer(std::string const& s, std::string const& context);

    // Read the "Gene" column of a gene list, preserving order and dropping duplicates
    std::vector<std::string> read_gene_list(const std::string& filename);
}

#endif //PLPDESIGN_TABLE_H
