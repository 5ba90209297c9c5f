#pragma once

int cmd_create(int argc, char** argv);
