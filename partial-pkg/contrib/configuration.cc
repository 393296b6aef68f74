// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Storage for the option tree plus the reader for the named.conf like
   configuration file format.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <partial-pkg/configuration.h>
#include <partial-pkg/error.h>
#include <partial-pkg/fileutl.h>
#include <partial-pkg/macros.h>
#include <partial-pkg/strutl.h>

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
									/*}}}*/

Configuration *_config = new Configuration;

// Configuration::Lookup - Walk down the :: separated name		/*{{{*/
// ---------------------------------------------------------------------
/* Tags compare case insensitive. An empty tag never matches an
   existing item, with Create it appends a new unnamed one. */
Configuration::Item *Configuration::Lookup(std::string const &Name, bool const Create)
{
   if (Name.empty() == true)
      return nullptr;

   Item *Itm = &Root;
   std::string::size_type Start = 0;
   while (Itm != nullptr)
   {
      std::string::size_type const End = Name.find("::", Start);
      std::string const Tag = Name.substr(Start, End == std::string::npos ? End : End - Start);

      Item *Found = nullptr;
      if (Tag.empty() == false)
	 for (auto const &Child : Itm->Children)
	    if (stringcasecmp(Child->Tag, Tag) == 0)
	    {
	       Found = Child.get();
	       break;
	    }
      if (Found == nullptr && Create == true)
      {
	 Itm->Children.emplace_back(new Item);
	 Found = Itm->Children.back().get();
	 Found->Tag = Tag;
	 Found->Parent = Itm;
      }
      Itm = Found;

      if (End == std::string::npos)
	 break;
      Start = End + 2;
   }
   return Itm;
}
									/*}}}*/
std::string Configuration::Item::FullTag() const
{
   if (Parent == nullptr || Parent->Parent == nullptr)
      return Tag;
   return Parent->FullTag() + "::" + Tag;
}
// Configuration::Find* - Typed read access				/*{{{*/
std::string Configuration::Find(std::string const &Name,const char *Default) const
{
   Item const * const Itm = Lookup(Name);
   if (Itm != nullptr && Itm->Value.empty() == false)
      return Itm->Value;
   return Default == nullptr ? std::string() : std::string(Default);
}
std::vector<std::string> Configuration::FindVector(std::string const &Name, std::string const &Default) const
{
   Item const * const Top = Lookup(Name);
   if (Top != nullptr && Top->Value.empty() == false)
      return VectorizeString(Top->Value, ',');
   if (Top == nullptr || Top->Children.empty() == true)
      return VectorizeString(Default, ',');

   std::vector<std::string> List;
   List.reserve(Top->Children.size());
   for (auto const &Child : Top->Children)
      List.push_back(Child->Value);
   return List;
}
int Configuration::FindI(std::string const &Name,int const Default) const
{
   std::string const Value = Find(Name);
   if (Value.empty() == true)
      return Default;
   char *End;
   long const Res = strtol(Value.c_str(), &End, 0);
   if (End == Value.c_str())
      return Default;
   return Res;
}
bool Configuration::FindB(std::string const &Name,bool const Default) const
{
   std::string const Value = Find(Name);
   if (Value.empty() == true)
      return Default;
   return StringToBool(Value, Default) == 1;
}
bool Configuration::Exists(std::string const &Name) const
{
   return Lookup(Name) != nullptr;
}
									/*}}}*/
// Configuration::Set - Write access					/*{{{*/
void Configuration::Set(std::string const &Name,std::string const &Value)
{
   Item * const Itm = Lookup(Name, true);
   if (Itm != nullptr)
      Itm->Value = Value;
}
void Configuration::Set(std::string const &Name,int const Value)
{
   Set(Name, std::to_string(Value));
}
void Configuration::CndSet(std::string const &Name,std::string const &Value)
{
   Item * const Itm = Lookup(Name, true);
   if (Itm != nullptr && Itm->Value.empty() == true)
      Itm->Value = Value;
}
void Configuration::CndSet(std::string const &Name,int const Value)
{
   CndSet(Name, std::to_string(Value));
}
void Configuration::Clear(std::string const &Name)
{
   Item * const Top = Lookup(Name, false);
   if (Top == nullptr)
      return;
   Top->Value.clear();
   Top->Children.clear();
}
void Configuration::Clear()
{
   Root.Children.clear();
}
									/*}}}*/
// Configuration::Dump - one Name "Value"; line per item		/*{{{*/
void Configuration::Dump(std::ostream &out, Item const &Itm)
{
   for (auto const &Child : Itm.Children)
   {
      out << Child->FullTag() << " \"" << Child->Value << "\";" << std::endl;
      Dump(out, *Child);
   }
}
void Configuration::Dump(std::ostream &out) const
{
   Dump(out, Root);
}
									/*}}}*/

// ConfigFileParser - Reader for the configuration file syntax		/*{{{*/
// ---------------------------------------------------------------------
/* The file is split into tokens first: words, "strings" and the
   characters { } ;. Comments never make it into the token list. */
class ConfigFileParser
{
   struct Token
   {
      enum Kind { Word, String, Open, Close, End } Type;
      std::string Text;
      unsigned int Line;
   };

   Configuration &Conf;
   std::string const FName;
   unsigned const Depth;
   std::vector<Token> Tokens;
   size_t Pos = 0;

   bool Fail(unsigned int const Line, char const * const Msg, std::string const &Arg = "")
   {
      return _error->Error("Syntax error %s:%u: %s%s", FName.c_str(), Line, Msg, Arg.c_str());
   }
   // never moves past the closing sentinel
   Token const &Next()
   {
      Token const &T = Tokens[Pos];
      if (Pos + 1 < Tokens.size())
	 ++Pos;
      return T;
   }
   bool AtEnd(Token const &T) const { return T.Type == Token::End && T.Line == 0; }
   bool IsValue(Token const &T) const { return T.Type == Token::Word || T.Type == Token::String; }

   bool Tokenize(std::string const &Data);
   bool Directive(Token const &Name);
   bool Statement(Token const &Name, std::string const &Scope);
   bool Block(std::string const &Scope, unsigned int const OpenLine);

   public:
   bool Parse();
   ConfigFileParser(Configuration &Conf, std::string const &FName, unsigned const Depth) :
      Conf(Conf), FName(FName), Depth(Depth) {}
};
									/*}}}*/
// ConfigFileParser::Tokenize						/*{{{*/
bool ConfigFileParser::Tokenize(std::string const &Data)
{
   unsigned int Line = 1;
   std::string::size_type I = 0;
   auto const SkipTo = [&](char const * const Marker) {
      std::string::size_type const Found = Data.find(Marker, I);
      std::string::size_type const Stop = (Found == std::string::npos) ? Data.length() : Found;
      Line += std::count(Data.begin() + I, Data.begin() + Stop, '\n');
      I = Stop;
      return Found != std::string::npos;
   };

   while (I < Data.length())
   {
      char const C = Data[I];
      if (C == '\n')
      {
	 ++Line;
	 ++I;
      }
      else if (isspace_ascii(C) != 0)
	 ++I;
      else if (Data.compare(I, 2, "//") == 0 ||
	    (C == '#' && Data.compare(I, 8, "#include") != 0 && Data.compare(I, 6, "#clear") != 0))
	 SkipTo("\n");
      else if (Data.compare(I, 2, "/*") == 0)
      {
	 unsigned int const Start = Line;
	 I += 2;
	 if (SkipTo("*/") == false)
	    return Fail(Start, "Unterminated comment");
	 I += 2;
      }
      else if (C == '{' || C == '}' || C == ';')
      {
	 Token::Kind const Type = (C == '{') ? Token::Open : (C == '}') ? Token::Close : Token::End;
	 Tokens.push_back(Token{Type, std::string(1, C), Line});
	 ++I;
      }
      else if (C == '"')
      {
	 std::string::size_type const Close = Data.find_first_of("\"\n", I + 1);
	 if (Close == std::string::npos || Data[Close] != '"')
	    return Fail(Line, "Unterminated string");
	 Tokens.push_back(Token{Token::String, Data.substr(I + 1, Close - I - 1), Line});
	 I = Close + 1;
      }
      else
      {
	 std::string::size_type Stop = I;
	 while (Stop < Data.length() && isspace_ascii(Data[Stop]) == 0 &&
	       strchr("{};\"", Data[Stop]) == nullptr)
	    ++Stop;
	 Tokens.push_back(Token{Token::Word, Data.substr(I, Stop - I), Line});
	 I = Stop;
      }
   }
   // the sentinel spares every lookahead a bounds check
   Tokens.push_back(Token{Token::End, std::string(), 0});
   return true;
}
									/*}}}*/
// ConfigFileParser::Directive - #include and #clear			/*{{{*/
bool ConfigFileParser::Directive(Token const &Name)
{
   Token const &Arg = Next();
   if (IsValue(Arg) == false)
      return Fail(Name.Line, Name.Text.c_str(), " directive requires an argument");
   if (Next().Type != Token::End)
      return Fail(Name.Line, "Extra junk after value");

   if (Name.Text == "#clear")
   {
      Conf.Clear(Arg.Text);
      return true;
   }
   if (Depth >= 10)
      return Fail(Name.Line, "Too many nested includes");
   if (ReadConfigFile(Conf, Arg.Text, Depth + 1) == false)
      return Fail(Name.Line, "Included from here");
   return true;
}
									/*}}}*/
// ConfigFileParser::Statement - Name Value; or Name { ... };		/*{{{*/
bool ConfigFileParser::Statement(Token const &Name, std::string const &Scope)
{
   std::string const Item = Scope.empty() ? Name.Text : Scope + "::" + Name.Text;
   Token const &T = Next();
   if (T.Type == Token::Open)
      return Block(Item, T.Line);
   if (AtEnd(T) == true)
      return Fail(Name.Line, "Missing ';' after ", Name.Text);
   if (T.Type == Token::End)
   {
      // a bare value is the next item of the enclosing list
      if (Scope.empty() == true)
	 return Fail(Name.Line, "Value without a name: ", Name.Text);
      Conf.Set(Scope + "::", Name.Text);
      return true;
   }
   if (IsValue(T) == false)
      return Fail(T.Line, "Unexpected '", T.Text + "'");

   Conf.Set(Item, T.Text);
   Token const &After = Next();
   if (After.Type == Token::Open)
      return Block(Item, After.Line);
   if (AtEnd(After) == true)
      return Fail(T.Line, "Missing ';' after ", T.Text);
   if (After.Type != Token::End)
      return Fail(After.Line, "Extra junk after value");
   return true;
}
									/*}}}*/
// ConfigFileParser::Block - Statements up to the matching }		/*{{{*/
bool ConfigFileParser::Block(std::string const &Scope, unsigned int const OpenLine)
{
   while (true)
   {
      Token const &T = Next();
      if (AtEnd(T) == true)
	 return Fail(OpenLine, "Block ", Scope + " is never closed");
      if (T.Type == Token::End)
	 continue;
      if (T.Type == Token::Close)
	 return true;
      if (T.Type == Token::Open)
	 return Fail(T.Line, "Block starts with no name.");
      if (T.Text[0] == '#' && T.Type == Token::Word)
	 return Fail(T.Line, "Directives can only be done at the top level");
      if (Statement(T, Scope) == false)
	 return false;
   }
}
									/*}}}*/
// ConfigFileParser::Parse - the top level of a file			/*{{{*/
bool ConfigFileParser::Parse()
{
   FileFd F;
   if (F.Open(FName, FileFd::ReadOnly) == false)
      return false;
   std::string Data;
   while (F.Eof() == false)
   {
      std::string Line;
      if (F.ReadLine(Line) == false)
	 return false;
      Data.append(Line).append("\n");
   }
   if (F.Close() == false || Tokenize(Data) == false)
      return false;

   while (Pos + 1 < Tokens.size())
   {
      Token const &T = Next();
      if (T.Type == Token::End)
	 continue;
      if (T.Type == Token::Close)
	 return Fail(T.Line, "Unexpected '}'");
      if (T.Type == Token::Open)
	 return Fail(T.Line, "Block starts with no name.");
      bool const Ok = (T.Type == Token::Word && T.Text[0] == '#') ? Directive(T) : Statement(T, "");
      if (Ok == false)
	 return false;
   }
   return true;
}
									/*}}}*/
bool ReadConfigFile(Configuration &Conf,const std::string &FName,unsigned const Depth)
{
   ConfigFileParser Parser(Conf, FName, Depth);
   return Parser.Parse();
}
