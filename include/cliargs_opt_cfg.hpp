// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_OPT_CFG_HPP_INCLUDED
#define CLIARGS_OPT_CFG_HPP_INCLUDED

#include "cliargs_result.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cliargs {
namespace detail {

    // Storage key of the configuration that accepts any unconfigured option
    constexpr char const* ANY_OPT = "*";

    // ( storeKey, option, optArg ) -> Result
    using Validator = std::function<Result( std::string_view, std::string_view, std::string_view )>;

    // Configuration of one option. All setters return *this so a configuration
    // can be built fluently:
    //
    //   OptCfg( "count" )["count"]["c"].hasArg( true )( "number of items" )
    class OptCfg {
        std::string m_storeKey;
        std::vector<std::string> m_names;
        bool m_hasArg = false;
        bool m_isArray = false;
        std::optional<std::vector<std::string>> m_defaults;
        std::string m_desc;
        std::string m_argInHelp;
        Validator m_validator;

    public:
        OptCfg() = default;
        explicit OptCfg( std::string storeKey ) : m_storeKey( std::move( storeKey ) ) {}

        auto storeKey() const -> std::string const& { return m_storeKey; }
        auto storeKey( std::string storeKey ) -> OptCfg & {
            m_storeKey = std::move( storeKey );
            return *this;
        }

        auto names() const -> std::vector<std::string> const& { return m_names; }
        auto names( std::vector<std::string> names ) -> OptCfg & {
            m_names = std::move( names );
            return *this;
        }
        auto operator[]( std::string const &name ) -> OptCfg & {
            m_names.push_back( name );
            return *this;
        }

        auto hasArg() const -> bool { return m_hasArg; }
        auto hasArg( bool hasArg ) -> OptCfg & {
            m_hasArg = hasArg;
            return *this;
        }

        auto isArray() const -> bool { return m_isArray; }
        auto isArray( bool isArray ) -> OptCfg & {
            m_isArray = isArray;
            return *this;
        }

        auto defaults() const -> std::optional<std::vector<std::string>> const& { return m_defaults; }
        auto defaults( std::vector<std::string> defaults ) -> OptCfg & {
            m_defaults = std::move( defaults );
            return *this;
        }
        auto defaults( std::optional<std::vector<std::string>> defaults ) -> OptCfg & {
            m_defaults = std::move( defaults );
            return *this;
        }

        auto desc() const -> std::string const& { return m_desc; }
        auto desc( std::string desc ) -> OptCfg & {
            m_desc = std::move( desc );
            return *this;
        }
        auto operator()( std::string const &desc ) -> OptCfg & {
            m_desc = desc;
            return *this;
        }

        auto argInHelp() const -> std::string const& { return m_argInHelp; }
        auto argInHelp( std::string argInHelp ) -> OptCfg & {
            m_argInHelp = std::move( argInHelp );
            return *this;
        }

        auto validator() const -> Validator const& { return m_validator; }
        auto validator( Validator validator ) -> OptCfg & {
            m_validator = std::move( validator );
            return *this;
        }

        // An empty validator accepts everything
        auto validate( std::string_view storeKey, std::string_view option, std::string_view optArg ) const -> Result {
            if( !m_validator )
                return Result::ok();
            return m_validator( storeKey, option, optArg );
        }

        auto firstName() const -> std::string {
            for( auto const &name : m_names ) {
                if( !name.empty() )
                    return name;
            }
            return std::string();
        }

        // The explicit store key, or the first non-empty name
        auto effectiveStoreKey() const -> std::string {
            if( !m_storeKey.empty() )
                return m_storeKey;
            return firstName();
        }

        auto isWildcard() const -> bool { return effectiveStoreKey() == ANY_OPT; }
        auto isIgnored() const -> bool { return effectiveStoreKey().empty(); }
    };


    // Indexes over a configuration vector, built once per parse. The schema
    // refers to the vector it was built from, which must outlive it.
    class Schema {
        std::vector<OptCfg> const* m_cfgs = nullptr;
        std::map<std::string, std::size_t, std::less<>> m_byName;
        std::map<std::string, std::size_t, std::less<>> m_byStoreKey;
        bool m_hasWildcard = false;

        explicit Schema( std::vector<OptCfg> const &cfgs ) : m_cfgs( &cfgs ) {}

    public:
        Schema() = default;

        static auto build( std::vector<OptCfg> const &cfgs ) -> BasicResult<Schema> {
            Schema schema( cfgs );

            for( std::size_t i = 0; i < cfgs.size(); ++i ) {
                auto const &cfg = cfgs[i];
                auto storeKey = cfg.effectiveStoreKey();
                if( storeKey.empty() )
                    continue;

                if( storeKey == ANY_OPT ) {
                    schema.m_hasWildcard = true;
                    continue;
                }

                auto firstName = cfg.firstName();
                if( !schema.m_byStoreKey.emplace( storeKey, i ).second )
                    return BasicResult<Schema>::fail( Error::storeKeyIsDuplicated( storeKey, firstName ) );

                if( !cfg.hasArg() ) {
                    if( cfg.isArray() )
                        return BasicResult<Schema>::fail( Error::configIsArrayButHasNoArg( storeKey, firstName ) );
                    if( cfg.defaults() && !cfg.defaults()->empty() )
                        return BasicResult<Schema>::fail( Error::configHasDefaultsButHasNoArg( storeKey, firstName ) );
                }

                if( firstName.empty() ) {
                    if( !schema.m_byName.emplace( storeKey, i ).second )
                        return BasicResult<Schema>::fail( Error::optionNameIsDuplicated( storeKey, storeKey ) );
                } else {
                    for( auto const &name : cfg.names() ) {
                        if( name.empty() )
                            continue;
                        if( !schema.m_byName.emplace( name, i ).second )
                            return BasicResult<Schema>::fail( Error::optionNameIsDuplicated( storeKey, name ) );
                    }
                }
            }

            return BasicResult<Schema>::ok( std::move( schema ) );
        }

        auto find( std::string_view name ) const -> OptCfg const* {
            auto it = m_byName.find( name );
            return it == m_byName.end() ? nullptr : &( *m_cfgs )[it->second];
        }

        auto findByStoreKey( std::string_view storeKey ) const -> OptCfg const* {
            auto it = m_byStoreKey.find( storeKey );
            return it == m_byStoreKey.end() ? nullptr : &( *m_cfgs )[it->second];
        }

        // Unknown names take no argument
        auto takesArg( std::string_view name ) const -> bool {
            auto cfg = find( name );
            return cfg && cfg->hasArg();
        }

        auto hasWildcard() const -> bool { return m_hasWildcard; }
    };

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_OPT_CFG_HPP_INCLUDED
