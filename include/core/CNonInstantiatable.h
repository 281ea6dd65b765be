/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CNonInstantiatable_h
#define INCLUDED_greenweb_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace greenweb {
namespace core {

//! \brief
//! Similar idea to boost::noncopyable, but for instantiation.
//!
//! DESCRIPTION:\n
//! Classes which only have static methods should inherit privately
//! from this class.
//!
class CORE_EXPORT CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_greenweb_core_CNonInstantiatable_h
