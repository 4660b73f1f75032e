#ifndef CMDTREE_CMDTREE_HPP
#define CMDTREE_CMDTREE_HPP

#include "app.hpp"
#include "color.hpp"
#include "command.hpp"
#include "context.hpp"
#include "error.hpp"
#include "flag.hpp"
#include "help.hpp"
#include "resolver.hpp"
#include "tokenizer.hpp"
#include "utils.hpp"

#endif // CMDTREE_CMDTREE_HPP
