/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CCsvLineParser_h
#define INCLUDED_greenweb_core_CCsvLineParser_h

#include <core/ImportExport.h>

#include <string>
#include <vector>

namespace greenweb {
namespace core {

//! \brief
//! Parses single lines of CSV formatted data.
//!
//! DESCRIPTION:\n
//! Splits one record of Excel style CSV into its fields.  Fields may be
//! quoted, in which case they can contain the separator, and a doubled
//! quote inside quotes stands for a literal quote.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The parser holds a pointer to the line it was last reset with rather
//! than a copy, so the line must outlive the parse.
//!
class CORE_EXPORT CCsvLineParser {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Default CSV separator
    static const char COMMA;
    //! CSV quote character
    static const char QUOTE;

public:
    explicit CCsvLineParser(char separator = COMMA);

    //! Supply a new line to be parsed.
    void reset(const std::string& line);

    //! Parse the next field from the current line.
    bool parseNext(std::string& value);

    //! Are we at the end of the current line?
    bool atEnd() const;

    //! Parse every field of \p line into \p fields.
    bool parseLine(const std::string& line, TStrVec& fields);

private:
    bool parseNextToken();

private:
    const char m_Separator;

    //! Did a separator follow the last field parsed?
    bool m_SeparatorAfterLastField{false};

    const std::string* m_Line{nullptr};
    std::string::const_iterator m_Current;
    std::string::const_iterator m_End;

    //! The field being built.  Its capacity settles at the size of the
    //! longest field seen.
    std::string m_WorkField;
};
}
}

#endif // INCLUDED_greenweb_core_CCsvLineParser_h
