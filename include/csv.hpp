#ifndef __CSV_HPP__
#define __CSV_HPP__

#include <string>
#include <vector>
#include <fstream>

#include "specindex.h"

namespace specindex {

    namespace csv {

        // Writes comma-delimited rows, quoting fields where required.
        class CSVWriter {
        private:
            std::string m_filename;
            std::ofstream m_str;

        public:
            // Quote the field if it contains a comma, a quote or a line break.
            // Embedded quotes are doubled.
            static std::string quote(const std::string &field) {
                if(field.find_first_of(",\"\r\n") == std::string::npos)
                    return field;
                std::string out = "\"";
                for(char c : field) {
                    if(c == '"')
                        out += '"';
                    out += c;
                }
                out += '"';
                return out;
            }

            CSVWriter(const std::string &filename) :
                m_filename(filename),
                m_str(filename.c_str(), std::ios::out | std::ios::trunc) {
                if(!m_str.good())
                    si_runerr("Failed to open file for writing: " << filename);
            }

            void write(const std::vector<std::string> &row) {
                for(size_t i = 0; i < row.size(); ++i) {
                    if(i > 0)
                        m_str << ',';
                    m_str << quote(row[i]);
                }
                m_str << "\n";
                if(!m_str.good())
                    si_runerr("Failed to write to " << m_filename);
            }

            void close() {
                m_str.close();
                if(m_str.fail())
                    si_runerr("Failed to close " << m_filename);
            }
        };

    } // csv

} // specindex

#endif
