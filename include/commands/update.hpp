#pragma once

int cmd_update(int argc, char** argv);
