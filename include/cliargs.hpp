// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

// cliargs v0.5.0

#ifndef CLIARGS_HPP_INCLUDED
#define CLIARGS_HPP_INCLUDED

#include "cliargs_config.hpp"
#include "cliargs_text.hpp"
#include "cliargs_result.hpp"
#include "cliargs_token.hpp"
#include "cliargs_validators.hpp"
#include "cliargs_opt_cfg.hpp"
#include "cliargs_parser.hpp"
#include "cliargs_store.hpp"
#include "cliargs_cmd.hpp"
#include "cliargs_help.hpp"

namespace cliargs {

// A parsed program invocation
using detail::Cmd;

// Configuration of one option, and the wildcard store key
using detail::OptCfg;
using detail::ANY_OPT;
using detail::Validator;

// Binding of user fields to options
using detail::Field;
using detail::OptStore;
using detail::makeOptCfgsFor;

// Help text for a set of options
using detail::Help;

// Result types of parse operations
using detail::BasicResult;
using detail::Result;
using detail::ResultBase;
using detail::Error;
using detail::ErrorKind;
using detail::ErrorFamily;

// Map from store key to option arguments
using detail::OptionMap;

// Argument validators
using detail::validateNumber;

} // namespace cliargs

#endif // CLIARGS_HPP_INCLUDED
