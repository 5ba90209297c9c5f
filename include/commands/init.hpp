#pragma once

int cmd_init(int argc, char** argv);
