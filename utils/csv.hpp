// utils/csv.hpp
#pragma once
#include <cctype>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Minimal CSV reader for recorded point frames:
    // - header → column index
    // - quoted fields
    // - comment / blank skipping
    // - line tracking for error messages
    // - typed helpers (int / double)
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            if (file_.is_open())
                file_.close();
            file_.clear();
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();
            line_no_ = 0;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_skippable(line))
                    continue;

                header_ = parse_line(line);
                for (size_t i = 0; i < header_.size(); ++i)
                {
                    trim_inplace(header_[i]);
                    col_index_[header_[i]] = static_cast<int>(i);
                }
                return true;
            }
            return false;
        }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                ++line_no_;
                if (is_skippable(line))
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        // Names from `required` that are absent from the header.
        std::vector<std::string> missing_columns(const std::vector<std::string> &required) const
        {
            std::vector<std::string> missing;
            for (const auto &name : required)
            {
                if (col(name) < 0)
                    missing.push_back(name);
            }
            return missing;
        }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        // 1-based line number of the last line consumed
        size_t line_number() const { return line_no_; }

        // ---- Typed helpers ----

        static int to_int(const std::string &s, int default_val = 0)
        {
            if (s.empty())
                return default_val;
            return std::stoi(s);
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            // supports scientific notation (1.00E-07)
            return std::stod(s);
        }

    private:
        // Blank, or '#' as the first non-space character
        static bool is_skippable(const std::string &s)
        {
            for (char c : s)
            {
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return c == '#';
            }
            return true;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else if (c == '"')
                {
                    in_quotes = true;
                }
                else if (c == ',')
                {
                    fields.push_back(cur);
                    cur.clear();
                }
                else if (c != '\r')
                {
                    cur.push_back(c);
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
        size_t line_no_ = 0;
    };

} // namespace utils
