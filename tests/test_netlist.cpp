#include "spicelib.hpp"
#include <gtest/gtest.h>

using namespace spice;

TEST(Clean, CommentsContinuationsAndCase) {
  std::string data = R"(
* title comment
R1  IN   OUT 1K $ load
+ TC1 = 0.1
   +
C1 out 0 'W * 2'
.include /Path/To/Models.lib
)";
  EXPECT_EQ(clean_netlist(data),
            "r1 in out 1k tc1=0.1\n"
            "c1 out 0 'w*2'\n"
            ".include /Path/To/Models.lib");
}

TEST(Clean, TabsAndBlankRuns) {
  EXPECT_EQ(clean_netlist("v1\tvdd\t\t0   1.8   \n\n  \t \nr1 a b 1k"), "v1 vdd 0 1.8\nr1 a b 1k");
}

TEST(Clean, AssignmentSpacing) {
  EXPECT_EQ(clean_netlist(".param vdd = 1.8 w =2u l= 1u"), ".param vdd=1.8 w=2u l=1u");
}

TEST(Clean, ComparisonsKeepTheirSpacing) {
  EXPECT_EQ(clean_netlist("if a <= b"), "if a <= b");
  EXPECT_EQ(clean_netlist("if a >= b"), "if a >= b");
  EXPECT_EQ(clean_netlist("if a != b"), "if a != b");
  EXPECT_EQ(clean_netlist("if a == b"), "if a == b");
  EXPECT_EQ(clean_netlist(".param vdd = 1.8"), ".param vdd=1.8");
}

TEST(Clean, EscapedDollarAndOrphanContinuation) {
  EXPECT_EQ(clean_netlist("v1 a 0 1 \\$ kept $ dropped"), "v1 a 0 1 \\$ kept");
  EXPECT_EQ(clean_netlist("+ r1 a b 1k"), "r1 a b 1k");
}

TEST(Clean, QuoteAwareSpaceRemoval) {
  EXPECT_EQ(remove_enclosed_space("a 'b + c' d 'e f'"), "a 'b+c' d 'ef'");
  EXPECT_EQ(clean_netlist(".param x = 'vdd / 2'"), ".param x='vdd/2'");
}

TEST(Clean, LineSequenceInput) {
  std::vector<std::string> lines = { "M1 D G S B NCH", "+ W=1U", "+ L=100N $ min length" };
  EXPECT_EQ(clean_netlist(lines), "m1 d g s b nch w=1u l=100n");
}

TEST(Clean, IncludeKeepsCaseAtAnyCase) {
  EXPECT_EQ(clean_netlist(".INCLUDE /Models/Foo.LIB"), ".INCLUDE /Models/Foo.LIB");
}

TEST(ElementTypes, Lookup) {
  const ElementType* t = find_element_type("R12");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "resistor");
  ASSERT_EQ(t->ports.size(), 2u);
  EXPECT_EQ(t->ports[0], "n+");
  EXPECT_EQ(t->ports[1], "n-");

  t = find_element_type("xm1");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "mosfet");
  EXPECT_EQ(t->ports.size(), 4u);

  t = find_element_type("XC3");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "capacitor");

  t = find_element_type("xr1");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "subcircuit");
  EXPECT_TRUE(t->ports.empty());

  t = find_element_type(".param");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "statement");

  t = find_element_type("U1");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, "uniformly distributed rc line");
  EXPECT_EQ(t->ports.size(), 3u);

  EXPECT_EQ(find_element_type("%foo"), nullptr);
  EXPECT_EQ(find_element_type(""), nullptr);
}

TEST(Parse, ResistorsAndSubcircuit) {
  auto els = parse_netlist(clean_netlist("r1 in out 1k\n.subckt a n1 n2\nr2 n1 n2 2k\n.ends\n"));
  ASSERT_EQ(els.size(), 4u);

  std::vector<Element> resistors;
  for (const auto& uid : els.order)
    if (els.by_uid.at(uid).category == "resistor") resistors.push_back(els.by_uid.at(uid));
  ASSERT_EQ(resistors.size(), 2u);

  const Element& r1 = resistors[0];
  EXPECT_EQ(r1.instance, "r1");
  EXPECT_EQ(r1.location, "root");
  EXPECT_EQ(r1.ports, (PortMap{ {"n+", "in"}, {"n-", "out"} }));
  EXPECT_EQ(r1.args, (std::vector<std::string>{ "1k" }));

  const Element& r2 = resistors[1];
  EXPECT_EQ(r2.instance, "r2");
  EXPECT_EQ(r2.location, "root/a");
  EXPECT_EQ(r2.ports, (PortMap{ {"n+", "n1"}, {"n-", "n2"} }));
  EXPECT_EQ(r2.args, (std::vector<std::string>{ "2k" }));

  const Element& sub = els.by_uid.at(els.order[1]);
  EXPECT_EQ(sub.instance, ".subckt");
  EXPECT_EQ(sub.category, "statement");
  EXPECT_EQ(sub.location, "root/a");
  EXPECT_TRUE(sub.ports.empty());
  EXPECT_EQ(sub.args, (std::vector<std::string>{ "a", "n1", "n2" }));

  const Element& ends = els.by_uid.at(els.order[3]);
  EXPECT_EQ(ends.instance, ".ends");
  EXPECT_EQ(ends.location, "root/a");
}

TEST(Parse, NestedHierarchy) {
  std::string data = R"(
.subckt a p
.subckt b q
r1 q 0 1k
.ends b
r2 p 0 1k
.ends a
r3 x 0 1k
)";
  auto els = parse_netlist(clean_netlist(data));
  ASSERT_EQ(els.size(), 7u);
  auto at = [&](std::size_t i) -> const Element& { return els.by_uid.at(els.order[i]); };
  EXPECT_EQ(at(0).location, "root/a");
  EXPECT_EQ(at(1).location, "root/a/b");
  EXPECT_EQ(at(2).instance, "r1");
  EXPECT_EQ(at(2).location, "root/a/b");
  EXPECT_EQ(at(3).location, "root/a/b");
  EXPECT_EQ(at(4).instance, "r2");
  EXPECT_EQ(at(4).location, "root/a");
  EXPECT_EQ(at(5).location, "root/a");
  EXPECT_EQ(at(6).instance, "r3");
  EXPECT_EQ(at(6).location, "root");
}

TEST(Parse, PortArityAndArgs) {
  auto els = parse_netlist("m1 d g s b nch w=1u l=100n\ne1 out 0 inp inn 10\nq1 c b e s npn");
  ASSERT_EQ(els.size(), 3u);

  const Element& m1 = els.by_uid.at(els.order[0]);
  EXPECT_EQ(m1.category, "mosfet");
  EXPECT_EQ(m1.ports, (PortMap{ {"n1", "d"}, {"n2", "g"}, {"n3", "s"}, {"n4", "b"} }));
  EXPECT_EQ(m1.args, (std::vector<std::string>{ "nch", "w=1u", "l=100n" }));

  const Element& e1 = els.by_uid.at(els.order[1]);
  EXPECT_EQ(e1.category, "vcvs");
  EXPECT_EQ(e1.port_string(), "out 0 inp inn");
  EXPECT_EQ(e1.args, (std::vector<std::string>{ "10" }));

  const Element& q1 = els.by_uid.at(els.order[2]);
  EXPECT_EQ(q1.category, "bjt");
  EXPECT_EQ(q1.args, (std::vector<std::string>{ "npn" }));
}

TEST(Parse, ControlSectionAndEndAreSkipped) {
  std::string data = R"(
r1 a b 1k
.control
run
print v(a)
.endc
r2 a b 2k
.end
)";
  auto els = parse_netlist(clean_netlist(data));
  ASSERT_EQ(els.size(), 2u);
  EXPECT_EQ(els.by_uid.at(els.order[0]).instance, "r1");
  EXPECT_EQ(els.by_uid.at(els.order[1]).instance, "r2");
}

TEST(Parse, UnknownElementTypeNamesTheLine) {
  try {
    parse_netlist("r1 a b 1k\n%oops a b");
    FAIL() << "expected unknown_element_type";
  } catch (const unknown_element_type& e) {
    EXPECT_EQ(e.line(), 1u);
    EXPECT_EQ(e.text(), "%oops a b");
    EXPECT_NE(std::string(e.what()).find("%oops a b"), std::string::npos);
  }
}

TEST(Parse, StructuralErrors) {
  EXPECT_THROW(parse_netlist("r1 a"), parse_error);
  EXPECT_THROW(parse_netlist(".ends"), parse_error);
  EXPECT_THROW(parse_netlist(".subckt"), parse_error);
  EXPECT_THROW(Circuit::from_string("r1 a b 1k\n%oops"), unknown_element_type);
}

TEST(Parse, LineByLine) {
  ParseContext ctx;
  auto e = parse_line(".subckt amp in out", 0, ctx);
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(ctx.location(), "root/amp");
  EXPECT_FALSE(parse_line("* a comment", 1, ctx).has_value());
  EXPECT_FALSE(parse_line("", 2, ctx).has_value());
  e = parse_line(".ends", 3, ctx);
  ASSERT_TRUE(e.has_value());
  EXPECT_EQ(e->location, "root/amp");
  EXPECT_EQ(ctx.location(), "root");
}

TEST(Parse, IdentifiersAreDeterministic) {
  EXPECT_EQ(make_uid(3, "r1 a b 1k"), make_uid(3, "r1 a b 1k"));
  EXPECT_NE(make_uid(3, "r1 a b 1k"), make_uid(4, "r1 a b 1k"));
  EXPECT_NE(make_uid(1, "2r"), make_uid(12, "r"));

  // Identical lines still get distinct identifiers.
  auto els = parse_netlist("r1 a b 1k\nr1 a b 1k");
  ASSERT_EQ(els.size(), 2u);
  EXPECT_NE(els.order[0], els.order[1]);

  auto again = parse_netlist("r1 a b 1k\nr1 a b 1k");
  EXPECT_EQ(els.order, again.order);
}
