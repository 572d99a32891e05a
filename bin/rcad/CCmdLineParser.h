/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_rcad_CCmdLineParser_h
#define INCLUDED_rca_rcad_CCmdLineParser_h

#include <string>

namespace rca {
namespace rcad {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc,
                      const char* const* argv,
                      std::string& configFile,
                      std::string& logProperties,
                      std::string& inputFileName,
                      std::string& outputFileName,
                      std::string& modelFile,
                      std::string& saveModelFile,
                      bool& retrain,
                      bool& evaluate);

    static const std::string VERSION;

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_rca_rcad_CCmdLineParser_h
