#ifndef JSONMAP_MAPPING_HPP_INCLUDED
#define JSONMAP_MAPPING_HPP_INCLUDED

// Copyright (C) 2013 Joshua M. Kriegshauser
//! \file jsonmap_mapping.hpp This file contains the schema registry and the mapper that decodes
//! json directly into application types

#include "jsonmap.hpp"
#include "jsonmap_print.hpp"

#include <deque>
#include <list>
#include <map>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace jsonmap
{
    class registry;
    class mapper;
    template<class T> class mapping;

    //! \brief Opt-in automatic derivation of a mapping.
    //! Specialize this template with <tt>static const bool available = true</tt> and a
    //! <tt>static void fields(mapping<T>&)</tt> function that declares the fields of \c T.
    //! registry::mapping_for() then builds and caches the mapping the first time \c T is requested.
    template<class T>
    struct describe
    {
        static const bool available = false;
    };

    //! \brief Reads and writes one schema.
    //! The primary template handles classes described by a registered jsonmap::mapping.
    //! Specializations provide the built-in scalar and container schemas.
    //! \c schema names the mapping for registered classes and is passed through containers to their elements.
    template<class T, class Enable = void>
    struct schema_traits
    {
        static void read(mapper& m, T& out, const std::string& schema);
        static json_value write(registry& r, const T& value, const std::string& schema);
    };

    //! Type-erased base of every mapping held by the registry.
    class mapping_base
    {
    public:
        virtual ~mapping_base() {}
        //! The type this mapping reads and writes.
        virtual const std::type_info& target_type() const = 0;
    };

    //! \brief Binds one json property name to a part of \c T.
    template<class T>
    class field_binding
    {
        //! Disable copy constructor and assignment
        field_binding(const field_binding&);
        field_binding& operator = (const field_binding&);

    public:
        field_binding(const std::string& name, const std::string& schema)
            : name_(name)
            , schema_(schema)
        {}

        virtual ~field_binding() {}

        const std::string& name() const { return name_; }

        //! The nested schema name. Empty means the field type's own schema.
        const std::string& schema() const { return schema_; }

        //! Consumes one value from the mapper's parser and stores it in \c target.
        virtual void read(mapper& m, T& target) const = 0;

        //! Converts the bound part of \c source to a json value.
        virtual void write(registry& r, const T& source, json_value& out) const = 0;

    private:
        std::string name_;
        std::string schema_;
    };

    ///////////////////////////////////////////////////////////////////////////
    // registry

    //! \brief Associates schemas with mappings.
    //! A schema is either a C++ type or a symbolic name bound to a type. The registry owns its mappings.
    //! Registration is not synchronized. add(), derive() and the first lazy derivation of a described
    //! type all register; finish them before sharing a registry between mappers on several threads.
    //! Resolving an already registered mapping only reads the registry.
    class registry
    {
        //! Disable copy constructor and assignment
        registry(const registry&);
        registry& operator = (const registry&);

        typedef std::map<std::type_index, std::unique_ptr<mapping_base> > type_map;
        typedef std::map<std::string, std::unique_ptr<mapping_base> > name_map;

    public:
        registry() {}

        //! \brief Starts a fresh mapping for \c T, replacing any previous mapping for \c T.
        //! \return the new mapping, for declaring its fields.
        template<class T>
        mapping<T>& add();

        //! \brief Starts a fresh mapping for \c T under the symbolic \c name, replacing any previous mapping of that name.
        template<class T>
        mapping<T>& add(const std::string& name);

        //! \brief Builds and registers the mapping of a type that specializes jsonmap::describe.
        //! Replaces any previous mapping for \c T.
        template<class T>
        const mapping<T>& derive()
        {
            return derive_mapping<T>(0);
        }

        template<class T>
        bool contains() const
        {
            return by_type_.find(std::type_index(typeid(T))) != by_type_.end();
        }

        bool contains(const std::string& name) const
        {
            return by_name_.find(name) != by_name_.end();
        }

        //! \brief Resolves the mapping for \c T.
        //! A type with no registered mapping is derived through jsonmap::describe when possible, which registers it.
        //! \param name Symbolic schema name, or empty to resolve by type.
        //! \param where Offset reported if the schema cannot be resolved.
        template<class T>
        const mapping<T>& mapping_for(const std::string& name = std::string(), std::size_t where = 0);

    private:
        template<class T>
        const mapping<T>& derive_mapping(std::size_t where);

        type_map by_type_;
        name_map by_name_;
    };

    ///////////////////////////////////////////////////////////////////////////
    // mapper

    //! \brief Decodes values from a parser using the schemas of a registry.
    //! Unknown object keys are skipped, never reported.
    class mapper
    {
        //! Disable copy constructor and assignment
        mapper(const mapper&);
        mapper& operator = (const mapper&);

    public:
        mapper(parser& p, registry& r)
            : parser_(p)
            , registry_(r)
        {}

        parser& get_parser() { return parser_; }
        registry& get_registry() { return registry_; }

        //! \brief Parses the next value into the generic containers.
        json_value next() { return parser_.next(); }

        //! \brief Parses the next value as a \c T.
        template<class T>
        T next_as()
        {
            T result = T();
            next_as(result);
            return result;
        }

        template<class T>
        void next_as(T& out)
        {
            parser_.skip_whitespace();
            read(out);
        }

        //! \brief Parses the next value as a \c T using the mapping registered under \c schema.
        template<class T>
        void next_as(T& out, const std::string& schema)
        {
            parser_.skip_whitespace();
            read(out, schema);
        }

        //! \brief Reads the value at the current position. Leading whitespace must already be consumed.
        template<class T>
        void read(T& out)
        {
            schema_traits<T>::read(*this, out, std::string());
        }

        template<class T>
        void read(T& out, const std::string& schema)
        {
            schema_traits<T>::read(*this, out, schema);
        }

        void fail_if_not_at_end() { parser_.fail_if_not_at_end(); }

    private:
        parser& parser_;
        registry& registry_;
    };

    ///////////////////////////////////////////////////////////////////////////
    // Field bindings

    //! \cond internal
    namespace internal
    {
        template<class T, class M>
        class member_binding : public field_binding<T>
        {
        public:
            member_binding(const std::string& name, M T::* member, const std::string& schema)
                : field_binding<T>(name, schema)
                , member_(member)
            {}

            virtual void read(mapper& m, T& target) const
            {
                m.read(target.*member_, this->schema());
            }

            virtual void write(registry& r, const T& source, json_value& out) const
            {
                out = schema_traits<M>::write(r, source.*member_, this->schema());
            }

        private:
            M T::* member_;
        };

        template<class T, class R, class A>
        class accessor_binding : public field_binding<T>
        {
            typedef typename std::decay<A>::type stored_type;

        public:
            typedef R (T::*getter_type)() const;
            typedef void (T::*setter_type)(A);

            accessor_binding(const std::string& name, getter_type getter, setter_type setter, const std::string& schema)
                : field_binding<T>(name, schema)
                , getter_(getter)
                , setter_(setter)
            {}

            virtual void read(mapper& m, T& target) const
            {
                stored_type value = stored_type();
                m.read(value, this->schema());
                (target.*setter_)(value);
            }

            virtual void write(registry& r, const T& source, json_value& out) const
            {
                out = schema_traits<stored_type>::write(r, (source.*getter_)(), this->schema());
            }

        private:
            getter_type getter_;
            setter_type setter_;
        };
    }
    //! \endcond

    ///////////////////////////////////////////////////////////////////////////
    // mapping

    //! \brief The ordered set of field bindings describing how \c T is read from and written to a json object.
    //! Obtained from registry::add() and declared fluently:
    //! \code
    //! reg.add<point>().field("x", &point::x).field("y", &point::y);
    //! \endcode
    template<class T>
    class mapping : public mapping_base
    {
        typedef std::vector<std::unique_ptr<field_binding<T> > > binding_list;

        //! Disable copy constructor and assignment
        mapping(const mapping&);
        mapping& operator = (const mapping&);

    public:
        typedef typename binding_list::const_iterator const_iterator;

        mapping() {}

        virtual const std::type_info& target_type() const { return typeid(T); }

        //! \brief Binds \c name to a data member.
        template<class M>
        mapping& field(const std::string& name, M T::* member)
        {
            return bind(new internal::member_binding<T, M>(name, member, std::string()));
        }

        //! \brief Binds \c name to a data member decoded with the mapping registered under \c schema.
        //! For sequences and maps the schema applies to the elements.
        template<class M>
        mapping& field(const std::string& name, M T::* member, const std::string& schema)
        {
            return bind(new internal::member_binding<T, M>(name, member, schema));
        }

        //! \brief Binds \c name to a getter/setter pair.
        template<class R, class A>
        mapping& property(const std::string& name, R (T::*getter)() const, void (T::*setter)(A))
        {
            return bind(new internal::accessor_binding<T, R, A>(name, getter, setter, std::string()));
        }

        template<class R, class A>
        mapping& property(const std::string& name, R (T::*getter)() const, void (T::*setter)(A), const std::string& schema)
        {
            return bind(new internal::accessor_binding<T, R, A>(name, getter, setter, schema));
        }

        std::size_t size() const { return bindings_.size(); }
        const_iterator begin() const { return bindings_.begin(); }
        const_iterator end() const { return bindings_.end(); }

        //! \brief Finds the binding for a json property name. Time order O(n).
        //! \return the binding, or NULL if the name is not bound.
        const field_binding<T>* find(const std::string& name) const
        {
            for (const_iterator it = bindings_.begin(); it != bindings_.end(); ++it)
            {
                if ((*it)->name() == name) return it->get();
            }
            return 0;
        }

        //! \brief Reads a json object into \c target. A json null leaves \c target unchanged.
        void read(mapper& m, T& target) const;

        //! \brief Writes the bound fields of \c source into \c out in declaration order.
        void write(registry& r, const T& source, json_object& out) const
        {
            for (const_iterator it = bindings_.begin(); it != bindings_.end(); ++it)
            {
                (*it)->write(r, source, out.put((*it)->name(), json_value()));
            }
        }

    private:
        // Declaring a name twice keeps the later binding in the earlier position.
        mapping& bind(field_binding<T>* binding)
        {
            std::unique_ptr<field_binding<T> > owned(binding);
            for (typename binding_list::iterator it = bindings_.begin(); it != bindings_.end(); ++it)
            {
                if ((*it)->name() == owned->name())
                {
                    *it = std::move(owned);
                    return *this;
                }
            }
            bindings_.push_back(std::move(owned));
            return *this;
        }

        binding_list bindings_;
    };

    //! \cond internal
    namespace internal
    {
        template<class T>
        struct field_reader
        {
            field_reader(const mapping<T>& m, mapper& r, T& target)
                : mapping_(m)
                , mapper_(r)
                , target_(target)
            {}

            void operator () (parser& p, const std::string& key)
            {
                const field_binding<T>* binding = mapping_.find(key);
                if (binding)
                {
                    binding->read(mapper_, target_);
                }
                else
                {
                    p.skip_value();
                }
            }

            const mapping<T>& mapping_;
            mapper& mapper_;
            T& target_;
        };

        template<class Seq, class E>
        struct element_reader
        {
            element_reader(mapper& m, Seq& out, const std::string& schema)
                : mapper_(m)
                , out_(out)
                , schema_(schema)
            {}

            void operator () (parser&)
            {
                E item = E();
                mapper_.read(item, schema_);
                out_.push_back(item);
            }

            mapper& mapper_;
            Seq& out_;
            const std::string& schema_;
        };

        template<class Map, class E>
        struct entry_reader
        {
            entry_reader(mapper& m, Map& out, const std::string& schema)
                : mapper_(m)
                , out_(out)
                , schema_(schema)
            {}

            void operator () (parser&, const std::string& key)
            {
                E item = E();
                mapper_.read(item, schema_);
                out_[key] = item;
            }

            mapper& mapper_;
            Map& out_;
            const std::string& schema_;
        };

        // Builds a mapping from jsonmap::describe when the type opts in
        template<class T, bool Available = describe<T>::available>
        struct derive
        {
            static std::unique_ptr<mapping<T> > create() { return std::unique_ptr<mapping<T> >(); }
        };

        template<class T>
        struct derive<T, true>
        {
            static std::unique_ptr<mapping<T> > create()
            {
                std::unique_ptr<mapping<T> > m(new mapping<T>());
                describe<T>::fields(*m);
                return m;
            }
        };

        // Consumes a null in place of a container or class. Returns false if the next value is not null.
        inline bool skip_null(parser& p)
        {
            if (p.peek_type() == value_null)
            {
                p.parse_null();
                return true;
            }
            return false;
        }
    }
    //! \endcond

    template<class T>
    inline void mapping<T>::read(mapper& m, T& target) const
    {
        parser& p = m.get_parser();
        if (internal::skip_null(p))
        {
            return;
        }
        if (p.peek_type() != value_object)
        {
            JSONMAP_DECODE_ERROR("object expected", p.position());
        }
        p.do_map(internal::field_reader<T>(*this, m, target));
    }

    ///////////////////////////////////////////////////////////////////////////
    // registry implementation

    template<class T>
    inline mapping<T>& registry::add()
    {
        std::unique_ptr<mapping<T> > m(new mapping<T>());
        mapping<T>& result = *m;
        by_type_[std::type_index(typeid(T))] = std::move(m);
        return result;
    }

    template<class T>
    inline mapping<T>& registry::add(const std::string& name)
    {
        std::unique_ptr<mapping<T> > m(new mapping<T>());
        mapping<T>& result = *m;
        by_name_[name] = std::move(m);
        return result;
    }

    template<class T>
    inline const mapping<T>& registry::derive_mapping(std::size_t where)
    {
        std::unique_ptr<mapping<T> > m = internal::derive<T>::create();
        if (!m)
        {
            JSONMAP_DECODE_ERROR(std::string("no mapping registered for ") + typeid(T).name(), where);
        }
        const mapping<T>& result = *m;
        by_type_[std::type_index(typeid(T))] = std::move(m);
        return result;
    }

    template<class T>
    inline const mapping<T>& registry::mapping_for(const std::string& name, std::size_t where)
    {
        if (!name.empty())
        {
            name_map::const_iterator it = by_name_.find(name);
            if (it == by_name_.end())
            {
                JSONMAP_DECODE_ERROR("no mapping registered for '" + name + "'", where);
            }
            if (it->second->target_type() != typeid(T))
            {
                JSONMAP_DECODE_ERROR("mapping '" + name + "' does not describe the requested type", where);
            }
            return *static_cast<const mapping<T>*>(it->second.get());
        }

        type_map::const_iterator it = by_type_.find(std::type_index(typeid(T)));
        if (it != by_type_.end())
        {
            return *static_cast<const mapping<T>*>(it->second.get());
        }
        return derive_mapping<T>(where);
    }

    ///////////////////////////////////////////////////////////////////////////
    // Schemas

    // Registered classes
    template<class T, class Enable>
    inline void schema_traits<T, Enable>::read(mapper& m, T& out, const std::string& schema)
    {
        m.get_registry().mapping_for<T>(schema, m.get_parser().position()).read(m, out);
    }

    template<class T, class Enable>
    inline json_value schema_traits<T, Enable>::write(registry& r, const T& value, const std::string& schema)
    {
        json_value result;
        r.mapping_for<T>(schema).write(r, value, result.make_object());
        return result;
    }

    template<>
    struct schema_traits<bool>
    {
        static void read(mapper& m, bool& out, const std::string&)
        {
            parser& p = m.get_parser();
            if (p.peek_type() != value_bool)
            {
                JSONMAP_DECODE_ERROR("boolean expected", p.position());
            }
            out = p.parse_boolean();
        }

        static json_value write(registry&, bool value, const std::string&)
        {
            return json_value(value);
        }
    };

    //! \cond internal
    namespace internal
    {
        template<class I>
        inline bool fits(long long i)
        {
            if (std::numeric_limits<I>::is_signed)
            {
                return i >= (long long)std::numeric_limits<I>::min() && i <= (long long)std::numeric_limits<I>::max();
            }
            return i >= 0 && (unsigned long long)i <= (unsigned long long)std::numeric_limits<I>::max();
        }

        inline void read_number(parser& p, json_value& out)
        {
            if (p.peek_type() != value_number)
            {
                JSONMAP_DECODE_ERROR("number expected", p.position());
            }
            p.parse_number(out);
        }
    }
    //! \endcond

    // Integral types other than bool. A whole floating point value such as 1e2 is accepted.
    template<class I>
    struct schema_traits<I, typename std::enable_if<std::is_integral<I>::value && !std::is_same<I, bool>::value>::type>
    {
        static void read(mapper& m, I& out, const std::string&)
        {
            parser& p = m.get_parser();
            const std::size_t where = p.position();
            json_value v;
            internal::read_number(p, v);

            long long i;
            if (v.is_integer())
            {
                i = v.as_integer();
            }
            else
            {
                const double d = v.as_number();
                if (d != std::floor(d))
                {
                    JSONMAP_DECODE_ERROR("integer expected", where);
                }
                if (d < -9223372036854775808.0 || d >= 9223372036854775808.0)
                {
                    JSONMAP_DECODE_ERROR("number out of range", where);
                }
                i = (long long)d;
            }

            if (!internal::fits<I>(i))
            {
                JSONMAP_DECODE_ERROR("number out of range", where);
            }
            out = static_cast<I>(i);
        }

        static json_value write(registry&, I value, const std::string&)
        {
            return json_value(value);
        }
    };

    template<class F>
    struct schema_traits<F, typename std::enable_if<std::is_floating_point<F>::value>::type>
    {
        static void read(mapper& m, F& out, const std::string&)
        {
            parser& p = m.get_parser();
            const std::size_t where = p.position();
            json_value v;
            internal::read_number(p, v);

            const double d = v.as_number();
            if (std::fabs(d) > double(std::numeric_limits<F>::max()))
            {
                JSONMAP_DECODE_ERROR("number out of range", where);
            }
            out = static_cast<F>(d);
        }

        static json_value write(registry&, F value, const std::string&)
        {
            return json_value(double(value));
        }
    };

    template<>
    struct schema_traits<std::string>
    {
        static void read(mapper& m, std::string& out, const std::string&)
        {
            parser& p = m.get_parser();
            if (p.peek_type() != value_string)
            {
                JSONMAP_DECODE_ERROR("string expected", p.position());
            }
            out = p.parse_string();
        }

        static json_value write(registry&, const std::string& value, const std::string&)
        {
            return json_value(value);
        }
    };

    // Any json value, kept in the generic containers
    template<>
    struct schema_traits<json_value>
    {
        static void read(mapper& m, json_value& out, const std::string&)
        {
            m.get_parser().parse_value(out);
        }

        static json_value write(registry&, const json_value& value, const std::string&)
        {
            return value;
        }
    };

    template<>
    struct schema_traits<json_object>
    {
        static void read(mapper& m, json_object& out, const std::string&)
        {
            parser& p = m.get_parser();
            if (internal::skip_null(p))
            {
                return;
            }
            if (p.peek_type() != value_object)
            {
                JSONMAP_DECODE_ERROR("object expected", p.position());
            }
            p.parse_map(out);
        }

        static json_value write(registry&, const json_object& value, const std::string&)
        {
            return json_value(value);
        }
    };

    //! \cond internal
    namespace internal
    {
        // Shared by the sequence containers. The previous contents are replaced.
        template<class Seq>
        struct sequence_traits
        {
            typedef typename Seq::value_type element_type;

            static void read(mapper& m, Seq& out, const std::string& schema)
            {
                parser& p = m.get_parser();
                if (skip_null(p))
                {
                    return;
                }
                if (p.peek_type() != value_array)
                {
                    JSONMAP_DECODE_ERROR("array expected", p.position());
                }
                out.clear();
                p.do_list(element_reader<Seq, element_type>(m, out, schema));
            }

            static json_value write(registry& r, const Seq& value, const std::string& schema)
            {
                json_value result;
                json_array& arr = result.make_array();
                for (typename Seq::const_iterator it = value.begin(); it != value.end(); ++it)
                {
                    arr.push_back(schema_traits<element_type>::write(r, *it, schema));
                }
                return result;
            }
        };
    }
    //! \endcond

    template<class E, class A>
    struct schema_traits<std::vector<E, A> > : internal::sequence_traits<std::vector<E, A> > {};

    template<class E, class A>
    struct schema_traits<std::list<E, A> > : internal::sequence_traits<std::list<E, A> > {};

    template<class E, class A>
    struct schema_traits<std::deque<E, A> > : internal::sequence_traits<std::deque<E, A> > {};

    // String-keyed maps. The previous contents are replaced.
    template<class E, class C, class A>
    struct schema_traits<std::map<std::string, E, C, A> >
    {
        typedef std::map<std::string, E, C, A> map_type;

        static void read(mapper& m, map_type& out, const std::string& schema)
        {
            parser& p = m.get_parser();
            if (internal::skip_null(p))
            {
                return;
            }
            if (p.peek_type() != value_object)
            {
                JSONMAP_DECODE_ERROR("object expected", p.position());
            }
            out.clear();
            p.do_map(internal::entry_reader<map_type, E>(m, out, schema));
        }

        static json_value write(registry& r, const map_type& value, const std::string& schema)
        {
            json_value result;
            json_object& obj = result.make_object();
            for (typename map_type::const_iterator it = value.begin(); it != value.end(); ++it)
            {
                obj.put(it->first, schema_traits<E>::write(r, it->second, schema));
            }
            return result;
        }
    };

    ///////////////////////////////////////////////////////////////////////////
    // Writing

    //! \brief Converts \c value to a json value using the schemas of \c r.
    template<class T>
    inline json_value to_value(registry& r, const T& value)
    {
        return schema_traits<T>::write(r, value, std::string());
    }

    //! \brief Converts \c value to a json value using the mapping registered under \c schema.
    template<class T>
    inline json_value to_value(registry& r, const T& value, const std::string& schema)
    {
        return schema_traits<T>::write(r, value, schema);
    }

    //! \brief Renders \c value as a json string.
    //! \param flags Flags controlling how json is printed
    template<class T>
    inline std::string to_json(registry& r, const T& value, int flags = 0)
    {
        return to_json(to_value(r, value), flags);
    }
}

#endif // JSONMAP_MAPPING_HPP_INCLUDED
