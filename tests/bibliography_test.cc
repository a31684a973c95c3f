#include <gtest/gtest.h>

#include <type_traits>

#include "bibtex.hh"

using namespace bibtex;

namespace {

  std::shared_ptr< Entry > make_article( const std::string& key ) {
    auto e = std::make_shared< Entry >( key, "article" );
    e->set_field( "author", "A. Author" ).set_field( "title", "Title" )
      .set_field( "journal", "Journal" ).set_field( "year", "2000" );
    return e;
  }

  std::shared_ptr< StringConstant > make_string( const std::string& name,
    const Value& value )
  {
    return std::make_shared< StringConstant >( name, value );
  }

  std::string literal_of( const Value& v ) {
    EXPECT_TRUE( v.is_atomic() );
    return std::get< std::string >( v.fragments().front() );
  }

} // namespace

TEST(BibliographyTest, StartsEmpty) {
  Bibliography bib;
  EXPECT_TRUE( bib.empty() );
  EXPECT_FALSE( bib.has_errors() );
  EXPECT_TRUE( bib.valid() );
  EXPECT_FALSE( bib.path().has_value() );
}

TEST(BibliographyTest, InitializeAddsData) {
  auto a = make_article( "a" );
  auto c = std::make_shared< Comment >( "c" );
  Bibliography bib( std::vector< element_ptr >{ a, c } );

  ASSERT_EQ( bib.size(), 2u );
  EXPECT_EQ( bib.to_a()[0], a );
  EXPECT_EQ( bib.to_a()[1], c );
  EXPECT_EQ( bib["a"], a );
}

TEST(BibliographyTest, AppendNullThrowsWithoutMutation) {
  Bibliography bib;
  bib << make_article( "a" );

  EXPECT_THROW( bib.append(nullptr), std::invalid_argument );
  EXPECT_THROW( bib.add(element_ptr()), std::invalid_argument );
  EXPECT_EQ( bib.size(), 1u );
}

TEST(BibliographyTest, AddCollectionIsAllOrNothing) {
  Bibliography bib;
  auto a = make_article( "a" );
  std::vector< element_ptr > data = { a, nullptr };

  EXPECT_THROW( bib.add(data), std::invalid_argument );
  EXPECT_TRUE( bib.empty() );
  EXPECT_EQ( bib["a"], nullptr );
  EXPECT_FALSE( a->attached() );
}

TEST(BibliographyTest, ElementBelongsToOneBibliography) {
  auto a = make_article( "a" );
  Bibliography first;
  Bibliography second;
  first.add( a );

  EXPECT_THROW( second.add(a), std::invalid_argument );
  EXPECT_TRUE( second.empty() );
  EXPECT_EQ( a->bibliography(), &first );
}

TEST(BibliographyTest, AddingAttachedElementAgainThrows) {
  auto a = make_article( "a" );
  Bibliography bib;
  bib.add( a );

  EXPECT_THROW( bib.add(a), std::invalid_argument );
  EXPECT_THROW( bib << a, std::invalid_argument );
  EXPECT_EQ( bib.size(), 1u );

  EXPECT_EQ( bib.remove(*a), a );
  EXPECT_TRUE( bib.empty() );
  EXPECT_FALSE( a->attached() );

  Bibliography other;
  EXPECT_NO_THROW( other.add(a) );
  EXPECT_EQ( a->bibliography(), &other );
}

TEST(BibliographyTest, CollectionWithRepeatedElementThrows) {
  auto a = make_article( "a" );
  auto b = make_article( "b" );
  Bibliography bib;

  EXPECT_THROW( bib.add(std::vector< element_ptr >{ a, b, a }),
    std::invalid_argument );
  EXPECT_TRUE( bib.empty() );
  EXPECT_FALSE( a->attached() );
  EXPECT_FALSE( b->attached() );
}

TEST(BibliographyTest, AddRegistersAndSetsBackReference) {
  Bibliography bib;
  auto a = make_article( "a" );
  auto w = make_string( "W", Value("World") );
  bib.add( a ).add( w );

  EXPECT_EQ( a->bibliography(), &bib );
  EXPECT_EQ( w->bibliography(), &bib );
  EXPECT_EQ( bib["a"], a );
  EXPECT_EQ( bib[" a "], a );
  EXPECT_EQ( bib["missing"], nullptr );
}

TEST(BibliographyTest, RemoveDetachesElement) {
  Bibliography bib;
  auto a = make_article( "a" );
  auto b = make_article( "b" );
  bib.add( std::vector< element_ptr >{ a, b } );

  element_ptr removed = bib.remove( *a );
  EXPECT_EQ( removed, a );
  EXPECT_EQ( bib.size(), 1u );
  EXPECT_EQ( bib.to_a().front(), b );
  EXPECT_FALSE( a->attached() );
  EXPECT_EQ( bib["a"], nullptr );
  EXPECT_EQ( bib["b"], b );
}

TEST(BibliographyTest, RemoveMatchesStructurally) {
  Bibliography bib;
  auto a = make_article( "a" );
  bib.add( a );

  Entry copy( *a );
  EXPECT_FALSE( copy.attached() );

  EXPECT_EQ( bib.remove(copy), a );
  EXPECT_TRUE( bib.empty() );
  EXPECT_FALSE( a->attached() );
}

TEST(BibliographyTest, RemoveAbsentReturnsNull) {
  Bibliography bib;
  bib.add( make_article("a") );
  EXPECT_EQ( bib.remove(Comment("nope")), nullptr );
  EXPECT_EQ( bib.size(), 1u );
}

TEST(BibliographyTest, RemoveAllClearsEverything) {
  Bibliography bib;
  auto a = make_article( "a" );
  auto w = make_string( "W", Value("World") );
  auto p = std::make_shared< Preamble >( Value("x") );
  bib.add( std::vector< element_ptr >{ a, w, p } );

  bib.remove_all();
  EXPECT_TRUE( bib.empty() );
  EXPECT_EQ( bib["a"], nullptr );
  EXPECT_FALSE( a->attached() );
  EXPECT_FALSE( w->attached() );
  EXPECT_FALSE( p->attached() );
  EXPECT_EQ( bib.to_hash().size(), 0u );
}

TEST(BibliographyTest, DuplicateKeysLastRegistrationWins) {
  Bibliography bib;
  auto first = make_article( "dup" );
  auto second = std::make_shared< Entry >( "dup", "misc" );
  bib.add( first ).add( second );

  EXPECT_EQ( bib.size(), 2u );
  EXPECT_EQ( bib["dup"], second );

  bib.remove( *first );
  EXPECT_EQ( bib["dup"], second );

  bib.remove( *second );
  EXPECT_EQ( bib["dup"], nullptr );
}

TEST(BibliographyTest, IndexViews) {
  auto w = make_string( "W", Value("World") );
  auto a = make_article( "a" );
  auto b = make_article( "b" );
  Bibliography bib( std::vector< element_ptr >{ b, w, a,
    std::make_shared< Comment >("c") } );

  EXPECT_EQ( bib.entries(),
    (std::vector< std::shared_ptr< Entry > >{ b, a }) );
  ASSERT_EQ( bib.constants().size(), 1u );
  EXPECT_EQ( bib.constants().at("W"), w );
  EXPECT_EQ( bib.constant("W"), w );
  EXPECT_EQ( bib.constant("w"), nullptr );

  bib.remove( *w );
  EXPECT_TRUE( bib.constants().empty() );
  EXPECT_EQ( bib.constant("W"), nullptr );
}

TEST(BibliographyTest, ElementsAreNotCopyAssignable) {
  // Assignment could change a key behind the index's back
  EXPECT_FALSE( std::is_copy_assignable< Entry >::value );
  EXPECT_FALSE( std::is_copy_assignable< StringConstant >::value );
  EXPECT_FALSE( std::is_move_assignable< Entry >::value );
  EXPECT_TRUE( std::is_copy_constructible< Entry >::value );
}

TEST(BibliographyTest, SetKeyReindexesEntry) {
  Bibliography bib;
  auto a = make_article( "old" );
  bib.add( a );

  a->set_key( "new" );
  EXPECT_EQ( bib["old"], nullptr );
  EXPECT_EQ( bib["new"], a );
}

TEST(BibliographyTest, TypeFiltersKeepOrderAndExactType) {
  auto p1 = std::make_shared< Preamble >( Value("one") );
  auto c1 = std::make_shared< Comment >( "one" );
  auto m1 = std::make_shared< MetaComment >( "one" );
  auto p2 = std::make_shared< Preamble >( Value("two") );
  auto c2 = std::make_shared< Comment >( "two" );

  Bibliography bib( std::vector< element_ptr >{ p1, make_article("a"), c1,
    m1, p2, c2 } );

  EXPECT_EQ( bib.preambles(), (std::vector< element_ptr >{ p1, p2 }) );
  EXPECT_EQ( bib.comments(), (std::vector< element_ptr >{ c1, c2 }) );
  EXPECT_EQ( bib.meta_comments(), (std::vector< element_ptr >{ m1 }) );
}

TEST(BibliographyTest, ValidityAggregatesEntriesAndErrors) {
  Bibliography bib;
  bib.add( make_article("a") );
  bib.add( std::make_shared< MetaComment >("ignored") );
  EXPECT_TRUE( bib.valid() );

  bib.add( std::make_shared< Entry >("b", "article") );
  EXPECT_FALSE( bib.valid() );

  Bibliography with_error;
  with_error.add( make_article("a") );
  with_error.add_error( ParseError{ "@article{", 1, "unexpected end" } );
  EXPECT_TRUE( with_error.has_errors() );
  EXPECT_FALSE( with_error.valid() );
  EXPECT_EQ( with_error.errors().size(), 1u );
}

TEST(BibliographyTest, ReplaceAndJoinScenario) {
  Bibliography bib;
  bib.add( make_string("W", Value("World")) );
  auto e = std::make_shared< Entry >( "hello", "misc" );
  e->set_field( "title", Value(std::vector< Fragment >{
    std::string("Hello, "), Reference{"W"} }) );
  bib.add( e );

  bib.replace_strings();
  bib.join_strings();

  EXPECT_EQ( literal_of(*e->field("title")), "Hello, World" );
}

TEST(BibliographyTest, ConstantChainInOrder) {
  auto a = make_string( "A", Value("x") );
  auto b = make_string( "B", Value(std::vector< Fragment >{
    Reference{"A"}, std::string("y") }) );
  Bibliography bib( std::vector< element_ptr >{ a, b } );

  bib.replace_strings();
  bib.join_strings();

  EXPECT_EQ( literal_of(b->value()), "xy" );
}

TEST(BibliographyTest, ConstantChainIsSinglePass) {
  // B is resolved before A, so it sees A's unresolved value
  auto c = make_string( "C", Value("z") );
  auto b = make_string( "B", Value(std::vector< Fragment >{
    Reference{"A"}, std::string("y") }) );
  auto a = make_string( "A", Value(Reference{"C"}) );
  Bibliography bib( std::vector< element_ptr >{ c, b, a } );

  bib.replace_strings();
  bib.join_strings();

  EXPECT_EQ( literal_of(a->value()), "z" );
  ASSERT_EQ( b->value().size(), 2u );
  EXPECT_EQ( std::get< Reference >( b->value().fragments()[0] ).name, "C" );
  EXPECT_EQ( std::get< std::string >( b->value().fragments()[1] ), "y" );
}

TEST(BibliographyTest, ReplaceHonoursIncludeSet) {
  auto w = make_string( "W", Value("World") );
  auto alias = make_string( "V", Value(Reference{"W"}) );
  auto p = std::make_shared< Preamble >( Value(Reference{"W"}) );
  auto e = std::make_shared< Entry >( "k", "misc" );
  e->set_field( "title", Reference{"W"} );
  auto c = std::make_shared< Comment >( "W" );
  Bibliography bib( std::vector< element_ptr >{ w, alias, p, e, c } );

  ResolveOptions only_entries;
  only_entries.include = { ElementType::Entry, ElementType::Comment };
  bib.replace_strings( only_entries );

  EXPECT_EQ( literal_of(*e->field("title")), "World" );
  EXPECT_TRUE( alias->value().has_references() );
  EXPECT_TRUE( p->value().has_references() );
  EXPECT_EQ( c->text(), "W" );
}

TEST(BibliographyTest, MoveRebindsBackReferences) {
  auto a = make_article( "a" );
  Bibliography first;
  first.add( a );

  Bibliography second( std::move(first) );
  EXPECT_EQ( a->bibliography(), &second );
  EXPECT_EQ( second["a"], a );

  Bibliography third;
  third = std::move( second );
  EXPECT_EQ( a->bibliography(), &third );
  EXPECT_EQ( third.size(), 1u );
}

TEST(BibliographyTest, DestructionClearsBackReferences) {
  auto a = make_article( "a" );
  {
    Bibliography bib;
    bib.add( a );
    EXPECT_TRUE( a->attached() );
  }
  EXPECT_FALSE( a->attached() );

  // Now free to join another bibliography
  Bibliography other;
  EXPECT_NO_THROW( other.add(a) );
}

TEST(BibliographyTest, SaveWithoutPathThrows) {
  Bibliography bib;
  EXPECT_THROW( bib.save(), std::logic_error );
}
