#pragma once
#include <tempo/protocol/exceptions.hpp>
#include <tempo/protocol/operations.hpp>

#include <fc/exception/exception.hpp>

#include <memory>
#include <vector>

namespace tempo { namespace chain {

class database;

using tempo::protocol::operation;

class evaluator
{
  public:
    virtual ~evaluator() {}

    virtual void apply( const operation& op ) = 0;
    virtual int get_type()const = 0;
};

/**
  * Applies one regular operation against the database. Evaluators hold no state of their own,
  * everything they change goes through the database so the surrounding undo session covers it.
  */
template< typename EvaluatorType >
class evaluator_impl : public evaluator
{
  public:
    evaluator_impl( database& d )
      : _db(d) {}

    virtual ~evaluator_impl() {}

    virtual void apply( const operation& o ) final override
    {
      auto* eval = static_cast< EvaluatorType* >(this);
      eval->do_apply( o.template get< typename EvaluatorType::operation_type >() );
    }

    virtual int get_type()const override { return operation::template tag< typename EvaluatorType::operation_type >::value; }

  protected:
    database& _db;
};

/// one slot per variant tag, virtual operations leave theirs empty
class evaluator_registry
{
  public:
    explicit evaluator_registry( database& d )
      : _db(d)
    {
      _op_evaluators.resize( operation::count() );
    }

    template< typename EvaluatorType >
    void register_evaluator()
    {
      _op_evaluators[ operation::template tag< typename EvaluatorType::operation_type >::value ].reset(
        new EvaluatorType( _db ) );
    }

    evaluator& get_evaluator( const operation& op )
    {
      const int which = op.which();
      TEMPO_VALIDATION_ASSERT( which >= 0 && size_t( which ) < _op_evaluators.size() && _op_evaluators[ which ],
        "No evaluator for operation ${i}", ("i", which) );
      return *_op_evaluators[ which ];
    }

  private:
    database&                                   _db;
    std::vector< std::unique_ptr< evaluator > > _op_evaluators;
};

} } // tempo::chain

#define TEMPO_DEFINE_EVALUATOR( X )                                                    \
class X ## _evaluator : public tempo::chain::evaluator_impl< X ## _evaluator >         \
{                                                                                      \
  public:                                                                              \
    typedef X ## _operation operation_type;                                            \
                                                                                       \
    X ## _evaluator( database& db )                                                    \
      : tempo::chain::evaluator_impl< X ## _evaluator >( db )                          \
    {}                                                                                 \
                                                                                       \
    void do_apply( const X ## _operation& o );                                         \
};
