#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/**
 * @brief Print usage, the command list and all options to stdout.
 */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
