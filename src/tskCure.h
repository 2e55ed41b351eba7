#pragma once

// Start the control task (cure controller, or the relay bench test when
// RELAY_DIAG_MODE is set). Returns false if the task could not be created.
bool createCureTask();
