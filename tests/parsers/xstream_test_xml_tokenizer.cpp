#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "xstream/parsers/xml.hpp"
#include <string>
#include <vector>

using namespace xstream::parsers::xml;

namespace
{
/// Copy of a token that outlives the tokenizer buffer.
struct Seen
{
  TokenKind kind;
  std::string name;
  std::string text;
  std::size_t depth;

  bool operator==(const Seen &o) const
  {
    return kind == o.kind && name == o.name && text == o.text && depth == o.depth;
  }
};

/// Drain every complete token currently available.
NextResult drain(StreamTokenizer &tok, std::vector<Seen> &out)
{
  NextResult r;
  while ((r = tok.next()) == NextResult::Token)
  {
    const Token &t = tok.current();
    out.push_back(Seen{t.kind, std::string(t.name), std::string(t.text), t.depth});
  }
  return r;
}

std::vector<Seen> tokenizeInChunks(const std::string &xml, std::size_t chunkSize)
{
  StreamTokenizer tok;
  std::vector<Seen> out;
  for (std::size_t i = 0; i < xml.size(); i += chunkSize)
  {
    REQUIRE(tok.append(std::string_view(xml).substr(i, chunkSize)));
    REQUIRE(drain(tok, out) == NextResult::NeedMore);
  }
  return out;
}
} // namespace

TEST_CASE("XML Tokenizer - Basic Parsing", "[xml][tokenizer][basic]")
{
  SECTION("Simple element parsing")
  {
    StreamTokenizer tok;
    tok.append("<root>hello</root>");

    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::StartElement);
    REQUIRE(tok.current().name == "root");
    REQUIRE(tok.current().depth == 1);

    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::Text);
    REQUIRE(tok.current().text == "hello");
    REQUIRE(tok.current().depth == 1);

    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::EndElement);
    REQUIRE(tok.current().name == "root");

    REQUIRE(tok.next() == NextResult::NeedMore);
    REQUIRE(tok.error() == nullptr);
    REQUIRE(tok.depth() == 0);
  }

  SECTION("Empty element parsing")
  {
    StreamTokenizer tok;
    tok.append("<empty/>");

    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::EmptyElement);
    REQUIRE(tok.current().name == "empty");
    REQUIRE(tok.current().selfClosing);
    REQUIRE(tok.current().depth == 1);
    REQUIRE(tok.depth() == 0);
  }

  SECTION("Element with attributes")
  {
    StreamTokenizer tok;
    tok.append("<elem attr1=\"value1\" attr2='value2'>");

    REQUIRE(tok.next() == NextResult::Token);
    const auto &t = tok.current();
    REQUIRE(t.kind == TokenKind::StartElement);
    REQUIRE(t.attributes.size() == 2);
    REQUIRE(t.attributes[0].name == "attr1");
    REQUIRE(t.attributes[0].value == "value1");
    REQUIRE(t.attributes[1].name == "attr2");
    REQUIRE(t.attributes[1].value == "value2");
  }

  SECTION("Whitespace inside elements is character data")
  {
    StreamTokenizer tok;
    tok.append("<a> hi </a>");
    std::vector<Seen> seen;
    drain(tok, seen);
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[1].text == " hi ");
  }
}

TEST_CASE("XML Tokenizer - Special Content", "[xml][tokenizer][special]")
{
  SECTION("XML declaration and comments before the root")
  {
    StreamTokenizer tok;
    tok.append("<?xml version='1.0'?>\n<!-- hello --><root>");
    std::vector<Seen> seen;
    REQUIRE(drain(tok, seen) == NextResult::NeedMore);
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0].kind == TokenKind::XmlDecl);
    REQUIRE(seen[0].text == "version='1.0'");
    REQUIRE(seen[1].kind == TokenKind::Comment);
    REQUIRE(seen[1].text == " hello ");
    REQUIRE(seen[2].kind == TokenKind::StartElement);
  }

  SECTION("CDATA section")
  {
    StreamTokenizer tok;
    tok.append("<root><![CDATA[This is <raw> content & stuff]]></root>");
    std::vector<Seen> seen;
    drain(tok, seen);
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[1].kind == TokenKind::CData);
    REQUIRE(seen[1].text == "This is <raw> content & stuff");
  }

  SECTION("Processing instruction")
  {
    StreamTokenizer tok;
    tok.append("<root><?target some data?></root>");
    std::vector<Seen> seen;
    drain(tok, seen);
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[1].kind == TokenKind::ProcessingInstruction);
    REQUIRE(seen[1].name == "target");
    REQUIRE(seen[1].text == "some data");
  }
}

TEST_CASE("XML Tokenizer - Incremental Input", "[xml][tokenizer][incremental]")
{
  SECTION("Nothing is produced until a construct is complete")
  {
    StreamTokenizer tok;
    tok.append("<ro");
    REQUIRE(tok.next() == NextResult::NeedMore);
    tok.append("ot a='");
    REQUIRE(tok.next() == NextResult::NeedMore);
    tok.append("1'");
    REQUIRE(tok.next() == NextResult::NeedMore);
    tok.append(">");
    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().name == "root");
    REQUIRE(tok.current().attributes.size() == 1);
    REQUIRE(tok.current().attributes[0].value == "1");
  }

  SECTION("Text waits for the following markup")
  {
    StreamTokenizer tok;
    tok.append("<root>hel");
    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.next() == NextResult::NeedMore);
    tok.append("lo");
    REQUIRE(tok.next() == NextResult::NeedMore);
    tok.append("</root>");
    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::Text);
    REQUIRE(tok.current().text == "hello");
  }

  SECTION("Any chunk size yields the same tokens")
  {
    const std::string xml = "<?xml version='1.0'?><stream:stream xmlns='jabber:client' "
                            "to='example.com'><message to='a@b'><body>x &amp; y</body>"
                            "</message><!-- keepalive --> <iq type='get'><![CDATA[a<b]]>"
                            "</iq></stream:stream>";
    std::vector<Seen> whole = tokenizeInChunks(xml, xml.size());
    REQUIRE(whole.size() == 13);
    for (std::size_t chunk : {1u, 2u, 3u, 5u, 7u, 16u})
    {
      INFO("chunk size " << chunk);
      REQUIRE(tokenizeInChunks(xml, chunk) == whole);
    }
  }

  SECTION("Consumed bytes are released")
  {
    StreamTokenizer tok;
    tok.append("<root><a/><b/>");
    std::vector<Seen> seen;
    drain(tok, seen);
    REQUIRE(tok.buffered() == 0);
    REQUIRE(tok.consumed() == 14);
    tok.append("<c");
    drain(tok, seen);
    REQUIRE(tok.buffered() == 2);
  }

  SECTION("Token offsets and lines are stream-relative")
  {
    StreamTokenizer tok;
    tok.append("<root>\n");
    std::vector<Seen> seen;
    drain(tok, seen);
    tok.append("<child/>");
    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().kind == TokenKind::Text);
    REQUIRE(tok.next() == NextResult::Token);
    REQUIRE(tok.current().name == "child");
    REQUIRE(tok.current().offset == 7);
    REQUIRE(tok.current().line == 2);
    REQUIRE(tok.current().column == 1);
  }
}

TEST_CASE("XML Tokenizer - Entity Decoding", "[xml][tokenizer][entities]")
{
  std::string output;
  Error err;

  SECTION("Predefined entities")
  {
    REQUIRE(StreamTokenizer::decodeEntities("&lt;&gt;&amp;&apos;&quot;", output, &err));
    REQUIRE(output == "<>&'\"");
  }

  SECTION("Numeric character references")
  {
    REQUIRE(StreamTokenizer::decodeEntities("&#65;&#x42;&#67;&#xe9;", output, &err));
    REQUIRE(output == "ABC\xC3\xA9");
  }

  SECTION("Invalid entity")
  {
    REQUIRE_FALSE(StreamTokenizer::decodeEntities("&unknown;", output, &err));
    REQUIRE(err.message == "unknown entity");
  }

  SECTION("Unterminated entity")
  {
    REQUIRE_FALSE(StreamTokenizer::decodeEntities("&amp", output, &err));
    REQUIRE(err.message == "unterminated entity");
  }

  SECTION("Out of range character reference")
  {
    REQUIRE_FALSE(StreamTokenizer::decodeEntities("&#x110000;", output, &err));
    REQUIRE_FALSE(StreamTokenizer::decodeEntities("&#xD800;", output, &err));
    REQUIRE(err.message == "invalid character reference");
  }

  SECTION("Escaping")
  {
    REQUIRE(StreamTokenizer::escape("a<b & 'c'") == "a&lt;b &amp; 'c'");
    REQUIRE(StreamTokenizer::escape("say \"hi\"", true) == "say &quot;hi&quot;");
  }
}

TEST_CASE("XML Tokenizer - QName Splitting", "[xml][tokenizer][qname]")
{
  Token token;

  SECTION("Simple name without namespace")
  {
    token.name = "element";
    auto [prefix, localName] = token.splitQName();
    REQUIRE(prefix.empty());
    REQUIRE(localName == "element");
  }

  SECTION("Namespaced name")
  {
    token.name = "stream:features";
    auto [prefix, localName] = token.splitQName();
    REQUIRE(prefix == "stream");
    REQUIRE(localName == "features");
  }
}

TEST_CASE("XML Tokenizer - Error Handling", "[xml][tokenizer][errors]")
{
  auto errorFor = [](const std::string &xml, const Options &opts = Options{})
  {
    StreamTokenizer tok(opts);
    std::vector<Seen> seen;
    REQUIRE(tok.append(xml));
    REQUIRE(drain(tok, seen) == NextResult::Error);
    REQUIRE(tok.error() != nullptr);
    return tok.error()->message;
  };

  SECTION("Mismatched end tag")
  {
    REQUIRE(errorFor("<root><child></root>").find("mismatched end tag") != std::string::npos);
  }

  SECTION("End tag without start tag")
  {
    REQUIRE(errorFor("</root>") == "end tag without matching start tag");
  }

  SECTION("Invalid tag name")
  {
    REQUIRE(errorFor("<123invalid>") == "invalid start tag name");
  }

  SECTION("Unquoted attribute value")
  {
    REQUIRE(errorFor("<elem attr=value>").find("attribute value") != std::string::npos);
  }

  SECTION("Duplicate attribute")
  {
    REQUIRE(errorFor("<elem a='1' a='2'>") == "duplicate attribute 'a'");
  }

  SECTION("Text outside the root element")
  {
    REQUIRE(errorFor("hello") == "character data outside of root element");
  }

  SECTION("Second root element")
  {
    REQUIRE(errorFor("<a/><b/>") == "multiple root elements");
  }

  SECTION("Depth limit exceeded")
  {
    Options opts;
    opts.maxDepth = 3;
    REQUIRE(errorFor("<a><b><c><d>", opts) == "maximum element depth exceeded");
  }

  SECTION("Attribute limit")
  {
    Options opts;
    opts.maxAttrsPerElement = 2;
    REQUIRE(errorFor("<a x='1' y='2' z='3'>", opts) == "too many attributes");
  }

  SECTION("Buffered input limit")
  {
    Options opts;
    opts.maxBufferedBytes = 8;
    REQUIRE(errorFor("<root attr='0123456789", opts) == "buffered input limit exceeded");
  }

  SECTION("Buffered input limit ignores complete constructs")
  {
    Options opts;
    opts.maxBufferedBytes = 8;
    StreamTokenizer tok(opts);
    std::vector<Seen> seen;
    REQUIRE(tok.append("<root attr='0123456789'><a/><b/>"));
    REQUIRE(drain(tok, seen) == NextResult::NeedMore);
    REQUIRE(seen.size() == 3);
    REQUIRE(tok.error() == nullptr);

    REQUIRE(tok.append("<held-back-for-too-long"));
    REQUIRE(drain(tok, seen) == NextResult::Error);
    REQUIRE(tok.error()->message == "buffered input limit exceeded");
  }

  SECTION("Errors are terminal")
  {
    StreamTokenizer tok;
    tok.append("<a></b>");
    std::vector<Seen> seen;
    REQUIRE(drain(tok, seen) == NextResult::Error);
    REQUIRE_FALSE(tok.append("</a>"));
    REQUIRE(tok.next() == NextResult::Error);
  }

  SECTION("Error position")
  {
    StreamTokenizer tok;
    tok.append("<root>\n  </other>");
    std::vector<Seen> seen;
    REQUIRE(drain(tok, seen) == NextResult::Error);
    REQUIRE(tok.error()->line == 2);
    REQUIRE(tok.error()->column == 3);
  }
}

TEST_CASE("XML Element - Tree Operations", "[xml][element]")
{
  auto root = std::make_shared<Element>("stream:stream");
  root->setAttribute("to", "example.com");
  REQUIRE(root->prefix() == "stream");
  REQUIRE(root->localName() == "stream");
  REQUIRE(root->attribute("to") == "example.com");
  REQUIRE_FALSE(root->hasAttribute("from"));

  auto msg = std::make_shared<Element>("message");
  msg->setAttribute("type", "chat");
  auto body = msg->addElement("body");
  body->addText("1 < 2 ");
  body->addText("& \"ok\"");

  SECTION("Children and text")
  {
    REQUIRE(msg->firstChildElement("body") == body);
    REQUIRE(msg->firstChildElement("subject") == nullptr);
    REQUIRE(body->children().size() == 1);
    REQUIRE(body->textContent() == "1 < 2 & \"ok\"");
    REQUIRE(msg->childElements().size() == 1);
  }

  SECTION("Serialization escapes text and attributes")
  {
    msg->setAttribute("type", "it's");
    REQUIRE(msg->toXml() ==
            "<message type='it&apos;s'><body>1 &lt; 2 &amp; \"ok\"</body></message>");
  }

  SECTION("Open tag only")
  {
    REQUIRE(root->openTag() == "<stream:stream to='example.com'>");
    REQUIRE(std::make_shared<Element>("presence")->toXml() == "<presence/>");
  }
}
