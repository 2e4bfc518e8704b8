// utils/csv.hpp
#pragma once
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Minimal CSV reader with:
    // - header → column index (first alias found wins)
    // - quoted fields
    // - comment / blank skipping
    // - strict numeric parsing and field quoting
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
            if (!std::getline(file_, line))
                return false;
            ++line_no_;

            strip_bom_and_cr(line);
            header_ = parse_line(line);
            for (size_t i = 0; i < header_.size(); ++i)
            {
                trim_inplace(header_[i]);
                col_index_[header_[i]] = static_cast<int>(i);
            }
            return true;
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
                strip_bom_and_cr(line);
                if (is_blank(line))
                    continue;
                if (!line.empty() && line[0] == '#')
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

        // First matching column among aliases, -1 if none present.
        int col_any(std::initializer_list<const char *> names) const
        {
            for (const char *n : names)
            {
                int idx = col(n);
                if (idx >= 0)
                    return idx;
            }
            return -1;
        }

        static std::string cell(const std::vector<std::string> &row, int idx)
        {
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        size_t line_number() const { return line_no_; }

        // Strict parse: the whole cell must be a number.
        static bool try_double(const std::string &s, double &out)
        {
            if (s.empty())
                return false;
            char *end = nullptr;
            const double v = std::strtod(s.c_str(), &end);
            if (end == s.c_str() || *end != '\0')
                return false;
            out = v;
            return true;
        }

        // Quote a field for writing if it contains separators or quotes.
        static std::string quote(const std::string &s)
        {
            if (s.find_first_of(",\"\n") == std::string::npos)
                return s;
            std::string out = "\"";
            for (char c : s)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

    private:
        static void strip_bom_and_cr(std::string &s)
        {
            if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
                static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF)
                s.erase(0, 3);
            if (!s.empty() && s.back() == '\r')
                s.pop_back();
        }

        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
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
                else
                {
                    if (c == '"')
                    {
                        in_quotes = true;
                    }
                    else if (c == ',')
                    {
                        fields.push_back(cur);
                        cur.clear();
                    }
                    else
                    {
                        cur.push_back(c);
                    }
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
