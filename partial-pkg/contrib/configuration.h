// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   A tree of scoped option names like Partial::Size, each carrying a
   text value. It is filled from the built-in defaults, the
   configuration files and the command line, in that order.

   A name with a trailing :: ("Partial::Include::") appends a new
   unnamed item below that name, FindVector reads such lists back.

   ##################################################################### */
									/*}}}*/
#ifndef PARTLIB_CONFIGURATION_H
#define PARTLIB_CONFIGURATION_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <partial-pkg/macros.h>

class PARTIAL_PUBLIC Configuration
{
   struct Item
   {
      std::string Tag;
      std::string Value;
      Item *Parent = nullptr;
      std::vector<std::unique_ptr<Item>> Children;

      std::string FullTag() const;
   };
   Item Root;

   Item *Lookup(std::string const &Name, bool const Create);
   Item const *Lookup(std::string const &Name) const
   {
      return const_cast<Configuration *>(this)->Lookup(Name, false);
   }
   static void Dump(std::ostream &out, Item const &Itm);

   public:

   /** \brief the value of Name, Default if it is unset or empty */
   std::string Find(std::string const &Name,const char *Default = nullptr) const;
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name,Default.c_str());};
   /** \brief the list stored at Name
    *
    *  A value set on the node itself is split at commas, so
    *  "-s main,contrib" and a list block give the same result.
    *
    *  \param Default comma separated list used if Name is unset */
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const;
   /** \brief numeric value, Default if it doesn't start with a number */
   int FindI(std::string const &Name,int const Default = 0) const;
   bool FindB(std::string const &Name,bool const Default = false) const;

   void Set(std::string const &Name,std::string const &Value);
   void Set(std::string const &Name,int const Value);
   void Set(std::string const &Name,char const *Value) { Set(Name, std::string(Value)); }
   void Set(std::string const &Name,bool const Value) { Set(Name, Value ? 1 : 0); }
   /** \brief set only if there is no value yet */
   void CndSet(std::string const &Name,std::string const &Value);
   void CndSet(std::string const &Name,int const Value);
   void CndSet(std::string const &Name,char const *Value) { CndSet(Name, std::string(Value)); }
   void CndSet(std::string const &Name,bool const Value) { CndSet(Name, Value ? 1 : 0); }

   bool Exists(std::string const &Name) const;

   /** \brief empty the value and drop all children of Name */
   void Clear(std::string const &Name);
   void Clear();

   /** \brief write the tree in the syntax ReadConfigFile accepts */
   void Dump(std::ostream &out = std::clog) const;

   Configuration() = default;
   Configuration(Configuration const &) = delete;
   Configuration &operator=(Configuration const &) = delete;
};

PARTIAL_PUBLIC extern Configuration *_config;

/** \brief read a configuration file into Conf
 *
 *  The syntax is that of named.conf:
 *    Partial::Size "CD80";
 *    Partial { Dist "stable,testing"; Include { "bash"; "dash"; }; };
 *  with C, C++ and shell style comments. At the top level
 *  "#include file;" reads another file and "#clear Name;" drops a tree.
 */
PARTIAL_PUBLIC bool ReadConfigFile(Configuration &Conf,const std::string &FName,
		    unsigned const Depth = 0);

#endif
