#pragma once

int cmd_lint(int argc, char** argv);
