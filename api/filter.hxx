# if !defined( __ffindex_api_filter_hxx__ )
# define __ffindex_api_filter_hxx__
# include "position-set.hxx"
# include <initializer_list>
# include <stdexcept>
# include <optional>
# include <memory>
# include <vector>

namespace ffindex
{

 /*
  * Expression
  *
  * Immutable tree of equality predicates joined by union (any) and
  * intersection (all). Subtrees are shared, so composing expressions never
  * copies the operands.
  *
  * Neither evaluation nor destruction recurses over the tree depth, so
  * expressions composed in a loop may be nested to any level.
  */
  template <class Key>
  class Expression
  {
  public:
    enum Kind: int
    {
      eq  = 0,    // positions of one key
      any = 1,    // union of the arguments
      all = 2     // intersection of the arguments
    };

  public:
    Expression( const Key& );
    Expression( Kind, std::vector<Expression>&& );

  public:
    auto  GetKind() const -> Kind {  return node->kind;  }
    auto  GetKey() const -> const Key&;
    auto  GetArgs() const -> const std::vector<Expression>& {  return node->args;  }

  protected:
    struct Node
    {
      Kind                    kind;
      std::optional<Key>      key;
      std::vector<Expression> args;

    public:
      Node( Kind k, std::optional<Key>&& v, std::vector<Expression>&& a ):
        kind( k ),
        key( std::move( v ) ),
        args( std::move( a ) ) {}
     ~Node();
    };

    std::shared_ptr<Node> node;

  };

  template <class Key>
  auto  Eq( const Key& key ) -> Expression<Key>
    {  return Expression<Key>( key );  }

  template <class Key>
  auto  Or( const Expression<Key>& a, const Expression<Key>& b ) -> Expression<Key>
    {  return Expression<Key>( Expression<Key>::any, { a, b } );  }

  template <class Key>
  auto  And( const Expression<Key>& a, const Expression<Key>& b ) -> Expression<Key>
    {  return Expression<Key>( Expression<Key>::all, { a, b } );  }

 /*
  * AnyOf( keys )
  *
  * Union of equality predicates for each of the keys; no keys means an
  * empty result.
  */
  template <class Key>
  auto  AnyOf( const std::vector<Key>& keys ) -> Expression<Key>
  {
    auto  args = std::vector<Expression<Key>>();

    for ( auto& key: keys )
      args.emplace_back( key );

    return Expression<Key>( Expression<Key>::any, std::move( args ) );
  }

 /*
  * Evaluate( expression, lookup )
  *
  * Resolve the expression to an ascending duplicate-free position set, the
  * lookup mapping a key to its ascending positions. Single keys are returned
  * borrowed, combinations are merged into owned sets.
  *
  * Nested nodes of the same kind are merged into one operands list, so a
  * chain of Or() or And() costs one merge. Alternating nodes are evaluated
  * with an explicit stack of frames.
  */
  template <class Key, class Lookup>
  auto  Evaluate( const Expression<Key>& expr, const Lookup& lookup ) -> PositionSet
  {
    struct Frame
    {
      typename Expression<Key>::Kind      kind;
      std::vector<const Expression<Key>*> operands;
      std::vector<PositionSet>            results;
    };

    auto  OpenFrame = []( const Expression<Key>& node ) -> Frame
    {
      auto  frame = Frame{ node.GetKind(), {}, {} };
      auto  nested = std::vector<const Expression<Key>*>{ &node };

      if ( frame.kind != Expression<Key>::any && frame.kind != Expression<Key>::all )
        throw std::logic_error( "unknown expression node kind" );

    // expand the subtrees of the same kind keeping the order of operands
      while ( !nested.empty() )
      {
        auto  next = nested.back();

        nested.pop_back();

        if ( next->GetKind() == frame.kind )
        {
          for ( auto it = next->GetArgs().rbegin(); it != next->GetArgs().rend(); ++it )
            nested.push_back( &*it );
        }
          else
        frame.operands.push_back( next );
      }
      return frame;
    };

    if ( expr.GetKind() == Expression<Key>::eq )
      return PositionSet( lookup( expr.GetKey() ) );

    auto  frames = std::vector<Frame>();

    for ( frames.push_back( OpenFrame( expr ) ); ; )
    {
      auto& top = frames.back();
      auto  done = top.results.size() == top.operands.size()
        || (top.kind == Expression<Key>::all && !top.results.empty() && top.results.back().empty());

      if ( !done )
      {
        auto& next = *top.operands[top.results.size()];

        if ( next.GetKind() == Expression<Key>::eq )
          top.results.emplace_back( lookup( next.GetKey() ) );
        else
          frames.push_back( OpenFrame( next ) );
        continue;
      }

      auto  output = top.kind == Expression<Key>::any ?
        Union( std::move( top.results ) ) : Intersect( std::move( top.results ) );

      frames.pop_back();

      if ( frames.empty() )
        return output;

      frames.back().results.push_back( std::move( output ) );
    }
  }

  // Expression implementation

  template <class Key>
  Expression<Key>::Expression( const Key& key ):
    node( std::make_shared<Node>( eq, std::optional<Key>( key ), std::vector<Expression>() ) )
  {
  }

  template <class Key>
  Expression<Key>::Expression( Kind kind, std::vector<Expression>&& args ):
    node( std::make_shared<Node>( kind, std::optional<Key>(), std::move( args ) ) )
  {
    if ( kind == eq )
      throw std::invalid_argument( "equality expression requires a key" );
  }

  template <class Key>
  auto  Expression<Key>::GetKey() const -> const Key&
  {
    if ( node->kind != eq )
      throw std::logic_error( "only equality expressions hold a key" );
    return *node->key;
  }

 /*
  * Node::~Node()
  *
  * Unlinks the uniquely owned subtrees into a local list and releases them
  * one by one, so the stack depth does not depend on the tree depth.
  */
  template <class Key>
  Expression<Key>::Node::~Node()
  {
    auto  detached = std::vector<std::shared_ptr<Node>>();
    auto  DetachArgs = [&]( std::vector<Expression>& list )
      {
        for ( auto& next: list )
          if ( next.node != nullptr && next.node.use_count() == 1 )
            detached.push_back( std::move( next.node ) );
      };

    for ( DetachArgs( args ); !detached.empty(); )
    {
      auto  last = std::move( detached.back() );

      detached.pop_back();
      DetachArgs( last->args );
    }
  }

}

# endif   // !__ffindex_api_filter_hxx__
