#pragma once

/**
 * @file sys_ids.h
 * @brief Device and supervisor call ID definitions
 *
 * These values are also predefined assembler symbols (CRT, KBD, HALT, ...).
 */

/* Devices (IN / OUT second operand) */
#define T91_DEV_CRT 0    /**< Display */
#define T91_DEV_KBD 1    /**< Keyboard */
#define T91_DEV_STDIN 6  /**< Standard input */
#define T91_DEV_STDOUT 7 /**< Standard output */

/* Supervisor calls (SVC second operand) */
#define T91_SVC_HALT 11  /**< Stop the machine */
#define T91_SVC_READ 12  /**< Read a number */
#define T91_SVC_WRITE 13 /**< Write a number */
#define T91_SVC_TIME 14  /**< Get time of day */
#define T91_SVC_DATE 15  /**< Get date */

/* Register aliases */
#define T91_REG_SP 6 /**< Stack pointer */
#define T91_REG_FP 7 /**< Frame pointer */
#define T91_REG_COUNT 8
