// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_RESULT_HPP_INCLUDED
#define CLIARGS_RESULT_HPP_INCLUDED

#include "cliargs_text.hpp"

#include <cstddef>
#include <new>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace cliargs {
namespace detail {

    enum class ErrorKind {
        // Encoding
        OsArgsContainInvalidUnicode,

        // Option usage
        OptionContainsInvalidChar,
        UnconfiguredOption,
        OptionNeedsArg,
        OptionTakesNoArg,
        OptionIsNotArray,
        OptionArgIsInvalid,

        // Schema consistency
        StoreKeyIsDuplicated,
        ConfigIsArrayButHasNoArg,
        ConfigHasDefaultsButHasNoArg,
        OptionNameIsDuplicated
    };

    enum class ErrorFamily {
        Encoding, OptionUsage, Config
    };

    inline auto familyOf( ErrorKind kind ) -> ErrorFamily {
        switch( kind ) {
            case ErrorKind::OsArgsContainInvalidUnicode:
                return ErrorFamily::Encoding;
            case ErrorKind::StoreKeyIsDuplicated:
            case ErrorKind::ConfigIsArrayButHasNoArg:
            case ErrorKind::ConfigHasDefaultsButHasNoArg:
            case ErrorKind::OptionNameIsDuplicated:
                return ErrorFamily::Config;
            default:
                return ErrorFamily::OptionUsage;
        }
    }

    inline auto kindName( ErrorKind kind ) -> char const* {
        switch( kind ) {
            case ErrorKind::OsArgsContainInvalidUnicode: return "OsArgsContainInvalidUnicode";
            case ErrorKind::OptionContainsInvalidChar: return "OptionContainsInvalidChar";
            case ErrorKind::UnconfiguredOption: return "UnconfiguredOption";
            case ErrorKind::OptionNeedsArg: return "OptionNeedsArg";
            case ErrorKind::OptionTakesNoArg: return "OptionTakesNoArg";
            case ErrorKind::OptionIsNotArray: return "OptionIsNotArray";
            case ErrorKind::OptionArgIsInvalid: return "OptionArgIsInvalid";
            case ErrorKind::StoreKeyIsDuplicated: return "StoreKeyIsDuplicated";
            case ErrorKind::ConfigIsArrayButHasNoArg: return "ConfigIsArrayButHasNoArg";
            case ErrorKind::ConfigHasDefaultsButHasNoArg: return "ConfigHasDefaultsButHasNoArg";
            case ErrorKind::OptionNameIsDuplicated: return "OptionNameIsDuplicated";
        }
        return "Unknown";
    }

    // One failure of the argument parser. Which of the accessors carry data
    // depends on kind():
    //
    //   OsArgsContainInvalidUnicode    index, rawArg
    //   OptionContainsInvalidChar      option
    //   UnconfiguredOption             option
    //   OptionNeedsArg                 option, storeKey
    //   OptionTakesNoArg               option, storeKey
    //   OptionIsNotArray               option, storeKey
    //   OptionArgIsInvalid             option, storeKey, optArg, details
    //   config errors                  storeKey, option (the offending name)
    class Error {
        ErrorKind m_kind;
        std::string m_option;
        std::string m_storeKey;
        std::string m_optArg;
        std::string m_details;
        std::size_t m_index = 0;
        std::string m_rawArg;

        explicit Error( ErrorKind kind ) : m_kind( kind ) {}

        static auto withOption( ErrorKind kind, std::string option, std::string storeKey = std::string() ) -> Error {
            Error e( kind );
            e.m_option = std::move( option );
            e.m_storeKey = std::move( storeKey );
            return e;
        }

    public:
        static auto osArgsContainInvalidUnicode( std::size_t index, std::string rawArg ) -> Error {
            Error e( ErrorKind::OsArgsContainInvalidUnicode );
            e.m_index = index;
            e.m_rawArg = std::move( rawArg );
            return e;
        }

        static auto optionContainsInvalidChar( std::string option ) -> Error {
            return withOption( ErrorKind::OptionContainsInvalidChar, std::move( option ) );
        }
        static auto unconfiguredOption( std::string option ) -> Error {
            return withOption( ErrorKind::UnconfiguredOption, std::move( option ) );
        }
        static auto optionNeedsArg( std::string option, std::string storeKey ) -> Error {
            return withOption( ErrorKind::OptionNeedsArg, std::move( option ), std::move( storeKey ) );
        }
        static auto optionTakesNoArg( std::string option, std::string storeKey ) -> Error {
            return withOption( ErrorKind::OptionTakesNoArg, std::move( option ), std::move( storeKey ) );
        }
        static auto optionIsNotArray( std::string option, std::string storeKey ) -> Error {
            return withOption( ErrorKind::OptionIsNotArray, std::move( option ), std::move( storeKey ) );
        }
        static auto optionArgIsInvalid( std::string option, std::string storeKey, std::string optArg, std::string details ) -> Error {
            Error e = withOption( ErrorKind::OptionArgIsInvalid, std::move( option ), std::move( storeKey ) );
            e.m_optArg = std::move( optArg );
            e.m_details = std::move( details );
            return e;
        }

        static auto storeKeyIsDuplicated( std::string storeKey, std::string name ) -> Error {
            return withOption( ErrorKind::StoreKeyIsDuplicated, std::move( name ), std::move( storeKey ) );
        }
        static auto configIsArrayButHasNoArg( std::string storeKey, std::string name ) -> Error {
            return withOption( ErrorKind::ConfigIsArrayButHasNoArg, std::move( name ), std::move( storeKey ) );
        }
        static auto configHasDefaultsButHasNoArg( std::string storeKey, std::string name ) -> Error {
            return withOption( ErrorKind::ConfigHasDefaultsButHasNoArg, std::move( name ), std::move( storeKey ) );
        }
        static auto optionNameIsDuplicated( std::string storeKey, std::string name ) -> Error {
            return withOption( ErrorKind::OptionNameIsDuplicated, std::move( name ), std::move( storeKey ) );
        }

        auto kind() const -> ErrorKind { return m_kind; }
        auto family() const -> ErrorFamily { return familyOf( m_kind ); }

        // The matched option name, or the offending name for config errors
        auto option() const -> std::string const& { return m_option; }
        auto storeKey() const -> std::string const& { return m_storeKey; }
        auto optArg() const -> std::string const& { return m_optArg; }
        auto details() const -> std::string const& { return m_details; }
        auto index() const -> std::size_t { return m_index; }
        auto rawArg() const -> std::string const& { return m_rawArg; }

        auto message() const -> std::string {
            auto q = []( std::string const &s ) { return "\"" + escape( s ) + "\""; };
            switch( m_kind ) {
                case ErrorKind::OsArgsContainInvalidUnicode:
                    return "The command line arguments contain invalid unicode (index: "
                        + std::to_string( m_index ) + ", argument: " + q( toLossyUtf8( m_rawArg ) ) + ")";
                case ErrorKind::OptionContainsInvalidChar:
                    return "The option contains invalid character (option: " + q( m_option ) + ")";
                case ErrorKind::UnconfiguredOption:
                    return "The option is not specified in configurations (option: " + q( m_option ) + ")";
                case ErrorKind::OptionNeedsArg:
                    return "The option needs argument(s) (option: " + q( m_option ) + ")";
                case ErrorKind::OptionTakesNoArg:
                    return "The option takes no argument (option: " + q( m_option ) + ")";
                case ErrorKind::OptionIsNotArray:
                    return "The option cannot have multiple arguments (option: " + q( m_option ) + ")";
                case ErrorKind::OptionArgIsInvalid:
                    return "The option argument is invalid (option: " + q( m_option )
                        + ", argument: " + q( m_optArg ) + ", details: " + q( m_details ) + ")";
                case ErrorKind::StoreKeyIsDuplicated:
                    return "The store key is duplicated (store_key: " + q( m_storeKey ) + ")";
                case ErrorKind::ConfigIsArrayButHasNoArg:
                    return "The configuration is specified both being an array and having no argument (store_key: "
                        + q( m_storeKey ) + ")";
                case ErrorKind::ConfigHasDefaultsButHasNoArg:
                    return "The configuration is specified both default argument(s) and having no argument (store_key: "
                        + q( m_storeKey ) + ")";
                case ErrorKind::OptionNameIsDuplicated:
                    return "The option name in the configuration is duplicated (store_key: "
                        + q( m_storeKey ) + ", name: " + q( m_option ) + ")";
            }
            return "Unknown error";
        }

        friend auto operator==( Error const &lhs, Error const &rhs ) -> bool {
            return lhs.m_kind == rhs.m_kind
                && lhs.m_option == rhs.m_option
                && lhs.m_storeKey == rhs.m_storeKey
                && lhs.m_optArg == rhs.m_optArg
                && lhs.m_details == rhs.m_details
                && lhs.m_index == rhs.m_index
                && lhs.m_rawArg == rhs.m_rawArg;
        }
        friend auto operator!=( Error const &lhs, Error const &rhs ) -> bool {
            return !( lhs == rhs );
        }

        friend auto operator<<( std::ostream &os, Error const &error ) -> std::ostream& {
            return os << error.message();
        }
    };


    class ResultBase {
    public:
        enum Type {
            Ok, LogicError, RuntimeError
        };

    protected:
        ResultBase( Type type ) : m_type( type ) {}
        virtual ~ResultBase() = default;

        ResultBase( ResultBase const & ) = default;
        auto operator=( ResultBase const & ) -> ResultBase & = default;

        virtual void enforceOk() const = 0;

        Type m_type;
    };

    template<typename T>
    class ResultValueBase : public ResultBase {
    public:
        auto value() const -> T const & {
            enforceOk();
            return m_value;
        }
        auto value() -> T & {
            enforceOk();
            return m_value;
        }

    protected:
        ResultValueBase( Type type ) : ResultBase( type ) {}

        ResultValueBase( ResultValueBase const &other ) : ResultBase( other ) {
            if( m_type == ResultBase::Ok )
                new( &m_value ) T( other.m_value );
        }

        ResultValueBase( ResultValueBase &&other ) : ResultBase( other ) {
            if( m_type == ResultBase::Ok )
                new( &m_value ) T( std::move( other.m_value ) );
        }

        ResultValueBase( Type, T value ) : ResultBase( Ok ) {
            new( &m_value ) T( std::move( value ) );
        }

        auto operator=( ResultValueBase const &other ) -> ResultValueBase & {
            if( this == &other )
                return *this;
            if( m_type == ResultBase::Ok )
                m_value.~T();
            ResultBase::operator=( other );
            if( m_type == ResultBase::Ok )
                new( &m_value ) T( other.m_value );
            return *this;
        }

        auto operator=( ResultValueBase &&other ) -> ResultValueBase & {
            if( this == &other )
                return *this;
            if( m_type == ResultBase::Ok )
                m_value.~T();
            ResultBase::operator=( other );
            if( m_type == ResultBase::Ok )
                new( &m_value ) T( std::move( other.m_value ) );
            return *this;
        }

        ~ResultValueBase() override {
            if( m_type == Ok )
                m_value.~T();
        }

        union {
            T m_value;
        };
    };

    template<>
    class ResultValueBase<void> : public ResultBase {
    protected:
        using ResultBase::ResultBase;
    };

    inline auto resultTypeOf( Error const &error ) -> ResultBase::Type {
        return error.family() == ErrorFamily::Config
            ? ResultBase::LogicError
            : ResultBase::RuntimeError;
    }

    // Config errors mean the program is wrong and are reported as LogicError.
    // Encoding and usage errors mean the input is wrong and are RuntimeError.
    template<typename T = void>
    class BasicResult : public ResultValueBase<T> {
    public:
        template<typename U>
        explicit BasicResult( BasicResult<U> const &other )
        :   ResultValueBase<T>( failedType( other.type() ) ),
            m_error( other.m_error )
        {}

        template<typename U>
        static auto ok( U &&value ) -> BasicResult { return { ResultBase::Ok, T( std::forward<U>( value ) ) }; }
        static auto ok() -> BasicResult { return { ResultBase::Ok }; }
        static auto fail( Error error ) -> BasicResult {
            auto type = resultTypeOf( error );
            return { type, std::move( error ) };
        }

        explicit operator bool() const { return m_type == ResultBase::Ok; }
        auto type() const -> ResultBase::Type { return m_type; }

        auto error() const -> Error const& {
            if( !m_error )
                throw std::logic_error( "cliargs: error() called on a successful result" );
            return *m_error;
        }

        auto errorMessage() const -> std::string {
            return m_error ? m_error->message() : std::string();
        }

    protected:
        template<typename U>
        friend class BasicResult;

        // Rejects Ok before the base is constructed
        static auto failedType( ResultBase::Type type ) -> ResultBase::Type {
            if( type == ResultBase::Ok )
                throw std::logic_error( "cliargs: only a failed result can be converted" );
            return type;
        }

        void enforceOk() const override {
            if( m_type != ResultBase::Ok )
                throw std::logic_error( "cliargs: value() called on a failed result: " + errorMessage() );
        }

        std::optional<Error> m_error; // Only populated if resultType is an error

        BasicResult( ResultBase::Type type, Error error )
        :   ResultValueBase<T>( type ),
            m_error( std::move( error ) )
        {}

        using ResultValueBase<T>::ResultValueBase;
        using ResultBase::m_type;
    };

    using Result = BasicResult<void>;

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_RESULT_HPP_INCLUDED
