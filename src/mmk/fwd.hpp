#ifndef METAMARK_MMK_FWD_HPP
#define METAMARK_MMK_FWD_HPP

#include "common/config.hpp"

namespace metamark::mmk {

enum struct Token_Type : Default_Underlying;
struct Token;
struct Scanner;
enum struct Tokenize_Error_Code : Default_Underlying;
struct Tokenize_Error;

enum struct Parse_Error_Code : Default_Underlying;
struct Parse_Error;

enum struct Metadata_Error_Code : Default_Underlying;
struct Metadata_Error;
struct Meta_Value;
struct Meta_Member;
struct Meta_Object;
using Metadata = Meta_Object;

enum struct Lossy_Scalar_Policy : Default_Underlying;
struct Parse_Options;

enum struct Document_Error_Kind : Default_Underlying;
struct Document_Error;

enum struct Write_Error_Code : Default_Underlying;

namespace ast {

struct Annotation;
struct Inline;
struct Text;
struct Bold;
struct Italic;
struct Inline_Code;
struct Link;
struct Inline_Math;

struct Block;
struct Heading;
struct Paragraph;
struct Component;
struct Code_Block;
enum struct Diagram_Kind : Default_Underlying;
struct Diagram;
struct Encryption_Info;
struct Secure_Block;
struct List_Item;
struct List;
struct Comment;
struct Math;

struct Document;

} // namespace ast

} // namespace metamark::mmk

#endif
