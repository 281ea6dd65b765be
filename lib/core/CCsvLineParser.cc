/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CCsvLineParser.h>

#include <core/CLogger.h>
#include <core/CoreTypes.h>

namespace greenweb {
namespace core {

const char CCsvLineParser::COMMA{','};
const char CCsvLineParser::QUOTE{'"'};

CCsvLineParser::CCsvLineParser(char separator) : m_Separator{separator} {
}

void CCsvLineParser::reset(const std::string& line) {
    m_SeparatorAfterLastField = false;
    m_Line = &line;
    m_Current = line.begin();
    m_End = line.end();
    m_WorkField.clear();
    m_WorkField.reserve(line.length());
}

bool CCsvLineParser::parseNext(std::string& value) {
    if (m_Line == nullptr || this->parseNextToken() == false) {
        return false;
    }
    value = m_WorkField;
    return true;
}

bool CCsvLineParser::atEnd() const {
    return m_Line == nullptr || m_Current == m_End;
}

bool CCsvLineParser::parseLine(const std::string& line, TStrVec& fields) {
    fields.clear();
    if (line.empty()) {
        fields.emplace_back();
        return true;
    }
    this->reset(line);
    std::string field;
    do {
        if (this->parseNext(field) == false) {
            return false;
        }
        fields.push_back(field);
    } while (this->atEnd() == false || m_SeparatorAfterLastField);
    return true;
}

bool CCsvLineParser::parseNextToken() {
    m_WorkField.clear();

    if (m_Current == m_End) {
        // A trailing separator means one more empty field
        if (m_SeparatorAfterLastField == false) {
            LOG_ERROR(<< "Trying to read too many fields from record:"
                      << core_t::LINE_ENDING << *m_Line);
            return false;
        }
        m_SeparatorAfterLastField = false;
        return true;
    }

    bool insideQuotes{false};
    for (; m_Current != m_End; ++m_Current) {
        char c{*m_Current};
        if (insideQuotes) {
            if (c == QUOTE) {
                auto next = m_Current + 1;
                if (next != m_End && *next == QUOTE) {
                    // Doubled quote
                    m_WorkField += QUOTE;
                    m_Current = next;
                } else {
                    insideQuotes = false;
                }
                continue;
            }
            m_WorkField += c;
        } else if (c == m_Separator) {
            ++m_Current;
            m_SeparatorAfterLastField = true;
            return true;
        } else if (c == QUOTE) {
            insideQuotes = true;
        } else {
            m_WorkField += c;
        }
    }

    m_SeparatorAfterLastField = false;

    if (insideQuotes) {
        LOG_ERROR(<< "Unmatched final quote in record:" << core_t::LINE_ENDING << *m_Line);
        return false;
    }
    return true;
}
}
}
