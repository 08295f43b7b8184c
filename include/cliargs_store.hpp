// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_STORE_HPP_INCLUDED
#define CLIARGS_STORE_HPP_INCLUDED

#include "cliargs_opt_cfg.hpp"
#include "cliargs_parser.hpp"
#include "cliargs_result.hpp"
#include "cliargs_text.hpp"
#include "cliargs_validators.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cliargs {
namespace detail {

    template<typename T>
    inline auto convertInto( std::string_view source, T &target, std::string &details ) -> bool {
        return parseNumber( source, target, details );
    }
    inline auto convertInto( std::string_view source, std::string &target, std::string & ) -> bool {
        target = std::string( source );
        return true;
    }

    template<typename T>
    inline auto coerce( std::string_view source, T &target, std::string const &storeKey, std::string const &option ) -> Result {
        std::string details;
        if( convertInto( source, target, details ) )
            return Result::ok();
        return Result::fail( Error::optionArgIsInvalid( option, storeKey, std::string( source ), details ) );
    }

    // Element types a field may hold, directly or inside std::optional and std::vector
    template<typename T>
    struct IsBindable : IsNumber<T> {};
    template<>
    struct IsBindable<std::string> : std::true_type {};

    template<typename T>
    inline auto validatorFor() -> Validator {
        if constexpr( IsNumber<T>::value )
            return &validateNumber<T>;
        else
            return Validator();
    }

    struct NonCopyable {
        NonCopyable() = default;
        NonCopyable( NonCopyable const & ) = delete;
        NonCopyable( NonCopyable && ) = delete;
        NonCopyable &operator=( NonCopyable const & ) = delete;
        NonCopyable &operator=( NonCopyable && ) = delete;
    };

    // A reference to a user's field. `values` is null when the field's key is
    // absent from the option map.
    struct BoundRef : NonCopyable {
        virtual ~BoundRef() = default;
        virtual auto takesArg() const -> bool { return true; }
        virtual auto isContainer() const -> bool { return false; }
        virtual auto validator() const -> Validator { return Validator(); }
        // Resets the field to a value-initialized state
        virtual void clear() = 0;
        virtual auto setValues( std::string const &storeKey,
                                std::string const &option,
                                std::vector<std::string_view> const *values ) -> Result = 0;
    };

    template<typename T>
    struct BoundValueRef : BoundRef {
        static_assert( IsBindable<T>::value,
                       "Fields must be bool, std::string, an 8 to 64 bit integer, float or double, "
                       "or a std::optional or std::vector of one of these" );
        T &m_ref;

        explicit BoundValueRef( T &ref ) : m_ref( ref ) {}

        auto validator() const -> Validator override { return validatorFor<T>(); }
        void clear() override { m_ref = T(); }

        auto setValues( std::string const &storeKey,
                        std::string const &option,
                        std::vector<std::string_view> const *values ) -> Result override {
            if( !values || values->empty() )
                return Result::ok();
            return coerce( values->front(), m_ref, storeKey, option );
        }
    };

    template<typename T>
    struct BoundValueRef<std::optional<T>> : BoundRef {
        static_assert( IsBindable<T>::value, "Unsupported type inside std::optional" );
        std::optional<T> &m_ref;

        explicit BoundValueRef( std::optional<T> &ref ) : m_ref( ref ) {}

        auto validator() const -> Validator override { return validatorFor<T>(); }
        void clear() override { m_ref.reset(); }

        auto setValues( std::string const &storeKey,
                        std::string const &option,
                        std::vector<std::string_view> const *values ) -> Result override {
            if( !values || values->empty() )
                return Result::ok();
            T temp{};
            auto result = coerce( values->front(), temp, storeKey, option );
            if( result )
                m_ref = std::move( temp );
            return result;
        }
    };

    template<typename T>
    struct BoundValueRef<std::vector<T>> : BoundRef {
        static_assert( IsBindable<T>::value, "Unsupported type inside std::vector" );
        std::vector<T> &m_ref;

        explicit BoundValueRef( std::vector<T> &ref ) : m_ref( ref ) {}

        auto isContainer() const -> bool override { return true; }
        auto validator() const -> Validator override { return validatorFor<T>(); }
        void clear() override { m_ref.clear(); }

        auto setValues( std::string const &storeKey,
                        std::string const &option,
                        std::vector<std::string_view> const *values ) -> Result override {
            if( !values )
                return Result::ok();
            std::vector<T> temp;
            temp.reserve( values->size() );
            for( auto value : *values ) {
                T elem{};
                auto result = coerce( value, elem, storeKey, option );
                if( !result )
                    return result;
                temp.push_back( std::move( elem ) );
            }
            m_ref = std::move( temp );
            return Result::ok();
        }
    };

    struct BoundFlagRef : BoundRef {
        bool &m_ref;

        explicit BoundFlagRef( bool &ref ) : m_ref( ref ) {}

        auto takesArg() const -> bool override { return false; }
        void clear() override { m_ref = false; }

        auto setValues( std::string const &,
                        std::string const &,
                        std::vector<std::string_view> const *values ) -> Result override {
            m_ref = values != nullptr;
            return Result::ok();
        }
    };

    // "s[a s b]" style default lists, where the separator s is one code
    // point; anything else is a single value
    inline auto parseDefaults( std::string_view spec ) -> std::vector<std::string> {
        auto split = []( std::string_view text, std::string_view sep ) {
            std::vector<std::string> parts;
            if( text.empty() )
                return parts;
            std::size_t start = 0;
            for(;;) {
                auto pos = text.find( sep, start );
                if( pos == std::string_view::npos ) {
                    parts.emplace_back( text.substr( start ) );
                    return parts;
                }
                parts.emplace_back( text.substr( start, pos - start ) );
                start = pos + sep.size();
            }
        };

        if( spec.empty() || spec.back() != ']' )
            return { std::string( spec ) };

        if( spec.front() == '[' )
            return split( spec.substr( 1, spec.size() - 2 ), "," );

        std::size_t pos = 0;
        char32_t cp = 0;
        if( decodeUtf8( spec, pos, cp ) && pos + 1 < spec.size() && spec[pos] == '[' )
            return split( spec.substr( pos + 1, spec.size() - pos - 2 ), spec.substr( 0, pos ) );

        return { std::string( spec ) };
    }

    struct CfgSpec {
        std::vector<std::string> names;
        std::optional<std::vector<std::string>> defaults;
    };

    // "names-spec[=default-spec]"
    inline auto parseCfgSpec( std::string_view spec ) -> CfgSpec {
        CfgSpec parsed;
        auto eq = spec.find( '=' );
        auto namesSpec = spec.substr( 0, eq );

        if( !trim( namesSpec ).empty() ) {
            std::size_t start = 0;
            for(;;) {
                auto comma = namesSpec.find( ',', start );
                parsed.names.emplace_back( trim( namesSpec.substr( start, comma == std::string_view::npos ? comma : comma - start ) ) );
                if( comma == std::string_view::npos )
                    break;
                start = comma + 1;
            }
        }

        if( eq != std::string_view::npos )
            parsed.defaults = parseDefaults( spec.substr( eq + 1 ) );
        return parsed;
    }

    class OptStore;

    // Binds one user field to an option. The field name is the store key.
    //
    //   Field( config.count, "count" ).cfg( "count,c=1" ).desc( "number of items" ).arg( "<n>" )
    class Field {
        std::shared_ptr<BoundRef> m_ref;
        std::string m_fieldName;
        std::string m_cfg;
        std::string m_desc;
        std::string m_argInHelp;

    public:
        template<typename T>
        Field( T &ref, std::string fieldName )
        :   m_ref( std::make_shared<BoundValueRef<T>>( ref ) ),
            m_fieldName( std::move( fieldName ) )
        {}

        Field( bool &ref, std::string fieldName )
        :   m_ref( std::make_shared<BoundFlagRef>( ref ) ),
            m_fieldName( std::move( fieldName ) )
        {}

        auto cfg( std::string spec ) -> Field & {
            m_cfg = std::move( spec );
            return *this;
        }
        auto desc( std::string desc ) -> Field & {
            m_desc = std::move( desc );
            return *this;
        }
        auto operator()( std::string const &desc ) -> Field & {
            m_desc = desc;
            return *this;
        }
        auto arg( std::string argInHelp ) -> Field & {
            m_argInHelp = std::move( argInHelp );
            return *this;
        }

        auto fieldName() const -> std::string const& { return m_fieldName; }

        auto makeOptCfg() const -> OptCfg {
            auto spec = parseCfgSpec( m_cfg );
            OptCfg cfg( m_fieldName );
            cfg.names( std::move( spec.names ) )
               .hasArg( m_ref->takesArg() )
               .isArray( m_ref->isContainer() )
               .defaults( std::move( spec.defaults ) )
               .desc( m_desc )
               .argInHelp( m_argInHelp )
               .validator( m_ref->validator() );
            return cfg;
        }

        auto setValue( OptionMap const &opts ) const -> Result {
            auto it = opts.find( m_fieldName );
            auto values = it == opts.end() ? nullptr : &it->second;
            return m_ref->setValues( m_fieldName, optionName( parseCfgSpec( m_cfg ).names ), values );
        }

        // Gives the field its configured defaults, or a value-initialized
        // state when it has none. A default that cannot be converted leaves
        // the field value-initialized and is reported.
        auto setDefault() const -> Result {
            auto spec = parseCfgSpec( m_cfg );
            m_ref->clear();
            if( !spec.defaults )
                return Result::ok();

            auto option = optionName( spec.names );
            if( !m_ref->takesArg() )
                return Result::fail( Error::configHasDefaultsButHasNoArg( m_fieldName, option ) );

            std::vector<std::string_view> values( spec.defaults->begin(), spec.defaults->end() );
            return m_ref->setValues( m_fieldName, option, &values );
        }

        template<typename T>
        auto operator|( T const &other ) const -> OptStore;

    private:
        // The first non-empty name, else the field name
        auto optionName( std::vector<std::string> const &names ) const -> std::string {
            for( auto const &name : names ) {
                if( !name.empty() )
                    return name;
            }
            return m_fieldName;
        }
    };

    // A set of fields, composed with operator|
    class OptStore {
        std::vector<Field> m_fields;

    public:
        OptStore() = default;

        auto operator|=( Field const &field ) -> OptStore & {
            m_fields.push_back( field );
            return *this;
        }

        auto operator|=( OptStore const &other ) -> OptStore & {
            m_fields.insert( m_fields.end(), other.m_fields.begin(), other.m_fields.end() );
            return *this;
        }

        template<typename T>
        auto operator|( T const &other ) const -> OptStore {
            return OptStore( *this ) |= other;
        }

        auto fields() const -> std::vector<Field> const& { return m_fields; }

        auto makeOptCfgs() const -> std::vector<OptCfg> {
            std::vector<OptCfg> cfgs;
            cfgs.reserve( m_fields.size() );
            for( auto const &field : m_fields )
                cfgs.push_back( field.makeOptCfg() );
            return cfgs;
        }

        // Stops at the first field whose argument cannot be converted
        auto setFieldValues( OptionMap const &opts ) const -> Result {
            for( auto const &field : m_fields ) {
                auto result = field.setValue( opts );
                if( !result )
                    return result;
            }
            return Result::ok();
        }

        // Resets every field to its defaults, stopping at the first one
        // whose default cannot be converted
        auto setDefaults() const -> Result {
            for( auto const &field : m_fields ) {
                auto result = field.setDefault();
                if( !result )
                    return result;
            }
            return Result::ok();
        }
    };

    template<typename T>
    auto Field::operator|( T const &other ) const -> OptStore {
        return OptStore() | *this | other;
    }

    inline auto makeOptCfgsFor( OptStore const &store ) -> std::vector<OptCfg> {
        return store.makeOptCfgs();
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_STORE_HPP_INCLUDED
